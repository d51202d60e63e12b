#include <wsarrow/backend/backend.hpp>

#include <wsarrow/backend/arrow_backend.hpp>
#include <wsarrow/backend/native_backend.hpp>

namespace wsarrow::backend {

auto to_string(BackendKind kind) noexcept -> std::string_view {
    switch (kind) {
        case BackendKind::Arrow:
            return "arrow";
        case BackendKind::Native:
            return "native";
    }
    return "unknown";
}

auto parse_backend_kind(std::string_view name) -> std::optional<BackendKind> {
    if (name == "arrow") {
        return BackendKind::Arrow;
    }
    if (name == "native") {
        return BackendKind::Native;
    }
    return std::nullopt;
}

auto make_backend(BackendKind kind) -> std::unique_ptr<Backend> {
    switch (kind) {
        case BackendKind::Arrow:
            return std::make_unique<ArrowBackend>();
        case BackendKind::Native:
            return std::make_unique<NativeBackend>();
    }
    return nullptr;
}

}  // namespace wsarrow::backend
