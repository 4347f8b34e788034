#pragma once

#include <vinfer/core/error.hpp>
#include <vinfer/core/frame.hpp>
#include <vinfer/vision/label_map.hpp>
#include <vinfer/vision/model.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vinfer::vision {

/// Compute device selector: "cpu", "cuda" (device 0) or "cuda:<index>".
struct DeviceSpec {
  bool cuda{false};
  int index{0};
};

[[nodiscard]] std::optional<DeviceSpec> parse_device(std::string_view device);

/// ONNX Runtime model capability: loads an exported .onnx model and implements IModel.
///
/// Recognized output layouts (fixed when the model is loaded):
/// - **Classification**: one output [1, C] of class scores. Softmax is applied
///   unless the scores already form a probability distribution.
/// - **End-to-end detection**: one output [1, N, 6] with (x1, y1, x2, y2, score, class_id)
///   per row, already suppressed (e.g. YOLOv10 or an NMS-exported model).
/// - **Raw YOLO head**: one output [1, 4 + C, N] (cx, cy, w, h, class scores);
///   decoded here with conf filtering and class-aware NMS at the request's iou.
/// - **Three outputs**: boxes [1, N, 4], scores [1, N], class_ids [1, N].
///
/// Input: one float tensor [1, 3, H, W]. Dynamic H/W use the request's imgsz
/// rounded up to a multiple of 32. Detection inputs are letterboxed and the
/// boxes mapped back to original image pixels.
///
/// Labels come from the model's `names` metadata entry, else from \p labels_path.
///
/// Thread-safety: predict() may be called concurrently (ORT sessions support
/// concurrent Run; all scratch buffers are per call).
class OnnxModel : public IModel {
 public:
  /// \param model_path Path to the .onnx file.
  /// \param device "cpu", "cuda" or "cuda:<index>".
  /// \param labels_path Optional labels file (one name per line) used when the
  ///        model carries no names metadata.
  /// \throws std::runtime_error on unsupported device or model layout;
  ///         Ort::Exception if the model cannot be loaded.
  OnnxModel(const std::string& model_path,
            const std::string& device = "cpu",
            const std::string& labels_path = {});

  ~OnnxModel() override;

  OnnxModel(const OnnxModel&) = delete;
  OnnxModel& operator=(const OnnxModel&) = delete;

  [[nodiscard]] std::expected<RawModelOutput, vinfer::core::Error>
  predict(const vinfer::core::Frame& image, const vinfer::core::PredictParams& params) override;

  [[nodiscard]] const LabelMap& labels() const override;

  void warmup() override;

  /// True if the loaded model produces class probabilities.
  [[nodiscard]] bool is_classifier() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vinfer::vision
