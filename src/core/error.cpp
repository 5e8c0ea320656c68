// ============================================================================
// cotree/core/error.cpp - Error Category Implementation
// ============================================================================

#include "cotree/core/error.hpp"

#include <utility>

namespace cotree {

namespace {

class CotreeCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "cotree"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::InvalidEdge:
                return "Invalid edge: target is not a Job or Handler";
            case Errc::InvalidStage:
                return "Callback stage not valid for this node kind";
            case Errc::ReuseViolation:
                return "Non-reusable handler invoked more than once";
            case Errc::NodeBusy:
                return "Node is still executing";
            case Errc::AlreadySubmitted:
                return "Node already attached to a parent";
            case Errc::ParentClosed:
                return "Parent no longer accepts children";
            case Errc::ExecutionFault:
                return "Node body failed";
            case Errc::ChildFailed:
                return "Child node failed";
            case Errc::Terminated:
                return "Node was terminated";
            case Errc::Stalled:
                return "Task tree stalled before resolving";
            case Errc::IoError:
                return "Event loop error";
            default:
                return "Unknown cotree error";
        }
    }
};

}  // namespace

const std::error_category& CotreeCategory() noexcept {
    static const CotreeCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), CotreeCategory()};
}

std::string Fault::Message() const {
    if (message.empty()) {
        return code.message();
    }
    return code.message() + ": " + message;
}

Fault MakeFault(Errc code, std::string message) {
    return Fault{make_error_code(code), std::move(message)};
}

Fault MakeFault(Error code, std::string message) {
    return Fault{code, std::move(message)};
}

}  // namespace cotree
