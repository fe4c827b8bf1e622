#include <recchain/core/error.hpp>

namespace recchain::core {

std::string_view to_string(PipelineError code) noexcept {
  switch (code) {
    case PipelineError::None:
      return "None";
    case PipelineError::UnknownStage:
      return "UnknownStage";
    case PipelineError::InputRequired:
      return "InputRequired";
    case PipelineError::UnsupportedInput:
      return "UnsupportedInput";
    case PipelineError::RegistrationFailed:
      return "RegistrationFailed";
    case PipelineError::IoError:
      return "IoError";
    case PipelineError::InvalidRecord:
      return "InvalidRecord";
    case PipelineError::InvalidArgument:
      return "InvalidArgument";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::HostFunctionFailed:
      return "HostFunctionFailed";
    default:
      return "Unknown";
  }
}

}  // namespace recchain::core
