#include <vinfer/vision/onnx_model.hpp>
#include "frame_cv_utils.hpp"
#include <vinfer/core/error.hpp>
#include <vinfer/core/frame.hpp>
#include <vinfer/core/log.hpp>
#include <vinfer/vision/box_postprocess.hpp>
#include <vinfer/vision/preprocess.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace vinfer::vision {

namespace {

namespace vc = vinfer::core;

constexpr std::int64_t kNumChannels = 3;
constexpr std::uint32_t kStride = 32;
constexpr std::size_t kMaxDetections = 300;

enum class OutputLayout {
  Classification,
  EndToEnd,
  YoloHead,
  ThreeOutputs,
};

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start, Clock::time_point end) {
  const double ms = std::chrono::duration<double, std::milli>(end - start).count();
  return ms < 0.0 ? 0.0 : ms;
}

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

vc::Error inference_error(std::string message) {
  return vc::Error{vc::ErrorCode::InferenceFailed, std::move(message)};
}

/// Softmax in place unless the values already look like probabilities.
void ensure_probabilities(std::vector<float>& scores) {
  if (scores.empty()) return;
  double sum = 0.0;
  bool in_unit_range = true;
  for (float s : scores) {
    if (s < 0.f || s > 1.f) in_unit_range = false;
    sum += s;
  }
  if (in_unit_range && std::abs(sum - 1.0) < 1e-3) return;

  const float max_v = *std::max_element(scores.begin(), scores.end());
  double denom = 0.0;
  for (float& s : scores) {
    s = std::exp(s - max_v);
    denom += s;
  }
  for (float& s : scores) s = static_cast<float>(s / denom);
}

}  // namespace

std::optional<DeviceSpec> parse_device(std::string_view device) {
  if (device.empty() || device == "cpu") return DeviceSpec{};
  if (device == "cuda") return DeviceSpec{true, 0};
  constexpr std::string_view kCudaPrefix = "cuda:";
  if (device.substr(0, kCudaPrefix.size()) == kCudaPrefix) {
    const std::string_view idx = device.substr(kCudaPrefix.size());
    int index = 0;
    auto [ptr, ec] = std::from_chars(idx.data(), idx.data() + idx.size(), index);
    if (ec != std::errc() || ptr != idx.data() + idx.size() || index < 0) return std::nullopt;
    return DeviceSpec{true, index};
  }
  return std::nullopt;
}

struct OnnxModel::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "vinfer"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::vector<std::string> output_names;
  std::vector<const char*> output_name_ptrs;

  /// 0 = dynamic (taken from the request's imgsz).
  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  OutputLayout layout{OutputLayout::EndToEnd};
  LabelMap labels;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::pair<std::uint32_t, std::uint32_t> input_size(std::uint32_t imgsz) const {
    const std::uint32_t dyn = round_up_to_stride(imgsz, kStride);
    return {input_width > 0 ? input_width : dyn, input_height > 0 ? input_height : dyn};
  }
};

OnnxModel::OnnxModel(const std::string& model_path,
                     const std::string& device,
                     const std::string& labels_path)
    : impl_(std::make_unique<Impl>()) {
  const auto device_spec = parse_device(device);
  if (!device_spec) {
    throw std::runtime_error("OnnxModel: unsupported device '" + device + "'");
  }
  if (device_spec->cuda) {
    OrtCUDAProviderOptions cuda_options{};
    cuda_options.device_id = device_spec->index;
    impl_->session_options.AppendExecutionProvider_CUDA(cuda_options);
  }
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxModel: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const std::vector<int64_t> in_dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (in_dims.size() != 4u || (in_dims[1] != kNumChannels && in_dims[1] > 0)) {
    throw std::runtime_error("OnnxModel: expected input shape [1,3,H,W]");
  }
  impl_->input_height = in_dims[2] > 0 ? static_cast<std::uint32_t>(in_dims[2]) : 0;
  impl_->input_width = in_dims[3] > 0 ? static_cast<std::uint32_t>(in_dims[3]) : 0;

  const size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    const std::vector<int64_t> out_dims =
        impl_->session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (out_dims.size() == 2u) {
      impl_->layout = OutputLayout::Classification;
    } else if (out_dims.size() == 3u && out_dims[2] == 6) {
      impl_->layout = OutputLayout::EndToEnd;
    } else if (out_dims.size() == 3u) {
      impl_->layout = OutputLayout::YoloHead;
    } else {
      throw std::runtime_error("OnnxModel: single output must be [1,C], [1,N,6] or [1,4+C,N]");
    }
  } else if (num_outputs >= 3u) {
    impl_->layout = OutputLayout::ThreeOutputs;
  } else {
    throw std::runtime_error("OnnxModel: model must have 1 output or at least 3 outputs (boxes, scores, class_ids)");
  }
  const size_t used_outputs = impl_->layout == OutputLayout::ThreeOutputs ? 3u : 1u;
  for (size_t i = 0; i < used_outputs; ++i) {
    impl_->output_names.push_back(impl_->session.GetOutputNameAllocated(i, allocator).get());
  }
  for (const auto& name : impl_->output_names) {
    impl_->output_name_ptrs.push_back(name.c_str());
  }

  Ort::ModelMetadata metadata = impl_->session.GetModelMetadata();
  Ort::AllocatedStringPtr names = metadata.LookupCustomMetadataMapAllocated("names", allocator);
  if (names) {
    if (auto parsed = LabelMap::parse_names_metadata(names.get())) {
      impl_->labels = std::move(*parsed);
    } else {
      VINFER_LOGW("model names metadata is not a {id: 'name'} dictionary; ignoring");
    }
  }
  if (impl_->labels.empty() && !labels_path.empty()) {
    auto loaded = LabelMap::load_file(labels_path);
    if (!loaded) {
      throw std::runtime_error("OnnxModel: cannot read labels file " + labels_path);
    }
    impl_->labels = std::move(*loaded);
  }

  VINFER_LOGI("loaded model ", model_path, " device=", device_spec->cuda ? "cuda" : "cpu",
              " task=", is_classifier() ? "classification" : "detection",
              " input=", impl_->input_width, "x", impl_->input_height,
              " labels=", impl_->labels.size());
}

OnnxModel::~OnnxModel() = default;

const LabelMap& OnnxModel::labels() const { return impl_->labels; }

bool OnnxModel::is_classifier() const noexcept {
  return impl_->layout == OutputLayout::Classification;
}

std::expected<RawModelOutput, vinfer::core::Error>
OnnxModel::predict(const vinfer::core::Frame& image, const vinfer::core::PredictParams& params) {
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto view = detail::mat_view(image);
  if (!view) {
    return std::unexpected(inference_error("unsupported pixel format"));
  }

  RawModelOutput out;
  const auto t_pre = Clock::now();

  cv::Mat bgr;
  if (view->channels() == 1) {
    cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
  } else if (view->channels() == 4) {
    cv::cvtColor(*view, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = *view;
  }

  const auto [in_w, in_h] = impl_->input_size(params.imgsz);
  Letterbox lb;
  if (impl_->layout == OutputLayout::Classification) {
    lb.image = resize_to(bgr, in_w, in_h);
  } else {
    lb = letterbox(bgr, in_w, in_h);
  }
  std::vector<float> input = to_nchw_rgb(lb.image);
  const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(in_h),
                                     static_cast<int64_t>(in_w)};
  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, input.data(), input.size(), shape.data(), shape.size());

  const auto t_infer = Clock::now();
  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    return std::unexpected(inference_error(std::string("onnxruntime: ") + e.what()));
  }

  const auto t_post = Clock::now();
  if (outputs.empty()) {
    return std::unexpected(inference_error("model returned no outputs"));
  }

  std::vector<BoxCandidate> candidates;
  switch (impl_->layout) {
    case OutputLayout::Classification: {
      const auto info = outputs[0].GetTensorTypeAndShapeInfo();
      const float* data = outputs[0].GetTensorData<float>();
      ClassProbabilities probs;
      probs.probs.assign(data, data + info.GetElementCount());
      ensure_probabilities(probs.probs);
      out.prediction = std::move(probs);
      break;
    }
    case OutputLayout::EndToEnd:
    case OutputLayout::YoloHead: {
      const auto info = outputs[0].GetTensorTypeAndShapeInfo();
      if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        return std::unexpected(inference_error("detection output must be a float tensor"));
      }
      const std::vector<int64_t> dims = info.GetShape();
      const float* data = outputs[0].GetTensorData<float>();
      if (dims.size() != 3u || dims[0] != 1) {
        return std::unexpected(inference_error("unexpected detection output rank"));
      }
      if (dims[2] == 6) {
        candidates = filter_end_to_end(data, dims[1], params.conf);
      } else {
        candidates = decode_yolo_head(data, dims[1], dims[2], params.conf);
        candidates = nms(std::move(candidates), NmsConfig{params.iou, kMaxDetections});
      }
      break;
    }
    case OutputLayout::ThreeOutputs: {
      if (outputs.size() < 3u) {
        return std::unexpected(inference_error("expected boxes, scores and class_ids outputs"));
      }
      const auto box_info = outputs[0].GetTensorTypeAndShapeInfo();
      const auto score_info = outputs[1].GetTensorTypeAndShapeInfo();
      const auto id_info = outputs[2].GetTensorTypeAndShapeInfo();
      if (box_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT ||
          score_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        return std::unexpected(inference_error("boxes and scores outputs must be float tensors"));
      }
      const std::span<const float> boxes(outputs[0].GetTensorData<float>(),
                                         box_info.GetElementCount());
      const std::span<const float> scores(outputs[1].GetTensorData<float>(),
                                          score_info.GetElementCount());
      const std::size_t id_count = id_info.GetElementCount();
      ClassIdView ids;
      switch (id_info.GetElementType()) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
          ids = std::span<const std::int64_t>(outputs[2].GetTensorData<std::int64_t>(), id_count);
          break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
          ids = std::span<const std::int32_t>(outputs[2].GetTensorData<std::int32_t>(), id_count);
          break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
          ids = std::span<const float>(outputs[2].GetTensorData<float>(), id_count);
          break;
        default:
          return std::unexpected(inference_error("unsupported class_ids element type"));
      }
      auto gathered = gather_three_outputs(boxes, scores, ids, params.conf);
      if (!gathered) return std::unexpected(gathered.error());
      candidates = std::move(*gathered);
      break;
    }
  }

  if (impl_->layout != OutputLayout::Classification) {
    unletterbox(candidates, lb.scale, lb.pad_x, lb.pad_y, image.width(), image.height());
    out.prediction = to_detection_boxes(candidates);
  }

  const auto t_end = Clock::now();
  out.speed.preprocess_ms = elapsed_ms(t_pre, t_infer);
  out.speed.inference_ms = elapsed_ms(t_infer, t_post);
  out.speed.postprocess_ms = elapsed_ms(t_post, t_end);
  return out;
}

void OnnxModel::warmup() {
  const auto [w, h] = impl_->input_size(vinfer::core::PredictParams{}.imgsz);
  std::vector<std::byte> buffer(vc::Frame::min_bytes(w, h, vc::PixelFormat::BGR8), std::byte{0});
  vc::Frame frame(w, h, vc::PixelFormat::BGR8, std::move(buffer));
  auto result = predict(frame, vinfer::core::PredictParams{});
  if (!result) {
    VINFER_LOGW("model warmup failed: ", result.error().message);
  }
}

}  // namespace vinfer::vision
