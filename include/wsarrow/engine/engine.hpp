#pragma once

#include <wsarrow/backend/backend.hpp>
#include <wsarrow/core/error.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/io/writer.hpp>
#include <wsarrow/query/query.hpp>
#include <wsarrow/schema/resolver.hpp>
#include <wsarrow/transport/transport.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>

namespace wsarrow::engine {

struct RunOptions {
    backend::BackendKind backend = backend::BackendKind::Arrow;
    bool flatten = false;
    /// Format and compression of the output; the target comes with each run.
    io::WriterOptions output;
    std::size_t page_size = transport::kDefaultPageSize;
    /// Pages fetched ahead of the one being appended; 0 fetches on demand.
    std::size_t prefetch_pages = 1;
    /// Flush a batch once it holds this many rows (checked between pages);
    /// 0 keeps everything in one batch.
    std::size_t max_rows_per_batch = 0;
    schema::ResolveOptions resolve;
};

struct RunSummary {
    std::size_t rows_written = 0;
    std::size_t batches_flushed = 0;
    std::size_t pages_fetched = 0;
    /// Records the service returned that failed the client-side filter check.
    std::size_t records_filtered = 0;
    bool cancelled = false;
};

/// Cooperative stop request, observed between pages.
class CancellationToken {
   public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
    [[nodiscard]] auto cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_relaxed);
    }

   private:
    std::atomic<bool> cancelled_{false};
};

/// Everything a run needs that can be decided before the first page fetch.
struct Plan {
    /// Schema the pages are decoded against (translations collapsed when a
    /// language is requested).
    std::shared_ptr<const Schema> schema;
    /// Schema of the output batches: the selected fields, or all of them.
    std::shared_ptr<const Schema> output_schema;
    query::QueryDescriptor descriptor;
};

/// Drives one resource listing from schema resolution to the written file.
class Engine {
   public:
    explicit Engine(transport::Transport& transport, RunOptions options = {});

    /// Fetch and resolve the schema of `resource`.
    [[nodiscard]] auto resolve(std::string_view resource) -> Result<Schema>;

    /// Resolve the schema and validate `constraints` against it. Never fetches
    /// a page, so schema and query errors surface before any listing request.
    [[nodiscard]] auto prepare(std::string_view resource, const query::Constraints& constraints)
        -> Result<Plan>;

    /// Fetch every page of `resource` matching `constraints` and write the
    /// resulting batches to `target`. Pages are appended strictly in order.
    [[nodiscard]] auto run(std::string_view resource, const query::Constraints& constraints,
                           const io::OutputTarget& target) -> Result<RunSummary>;

    [[nodiscard]] auto cancellation() noexcept -> CancellationToken& { return cancel_; }
    [[nodiscard]] auto options() const noexcept -> const RunOptions& { return options_; }

   private:
    transport::Transport& transport_;
    RunOptions options_;
    CancellationToken cancel_;
};

}  // namespace wsarrow::engine
