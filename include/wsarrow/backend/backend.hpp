#pragma once

#include <wsarrow/batch/batch.hpp>
#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/io/writer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace wsarrow::backend {

enum class BackendKind : std::uint8_t {
    Arrow,   // Arrow ArrayBuilder trees
    Native,  // Column<T> + validity, converted to Arrow at the write boundary
};

[[nodiscard]] auto to_string(BackendKind kind) noexcept -> std::string_view;
[[nodiscard]] auto parse_backend_kind(std::string_view name) -> std::optional<BackendKind>;

/// Factory for the builder and writer of one columnar representation.
class Backend {
   public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> BackendKind = 0;
    [[nodiscard]] auto name() const noexcept -> std::string_view { return to_string(kind()); }

    /// Builder for batches of `schema`. Fails with a schema error when the
    /// layout cannot be derived (flattened name collision).
    [[nodiscard]] virtual auto make_builder(std::shared_ptr<const Schema> schema,
                                            batch::BuildOptions options) const
        -> Result<std::unique_ptr<batch::BatchBuilder>> = 0;

    /// Writer accepting the batches this backend builds.
    [[nodiscard]] virtual auto make_writer(io::WriterOptions options) const
        -> Result<std::unique_ptr<io::BatchWriter>> = 0;
};

[[nodiscard]] auto make_backend(BackendKind kind) -> std::unique_ptr<Backend>;

}  // namespace wsarrow::backend
