#include <wsarrow/engine/engine.hpp>

#include <wsarrow/record/parser.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <deque>
#include <exception>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace wsarrow::engine {

namespace {

using PageFuture = std::future<Result<transport::Page>>;

auto tag(Error error, std::string_view resource) -> Error {
    if (!error.resource.empty()) {
        return error;
    }
    return std::move(error).with_resource(std::string(resource));
}

auto tag(Error error, std::string_view resource, std::size_t page) -> Error {
    return tag(std::move(error), resource).with_page(page);
}

auto wait_for(PageFuture& future) -> Result<transport::Page> {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return std::unexpected(internal_error(fmt::format("page fetch failed: {}", e.what())));
    }
}

/// One run in progress: the page window, the open builder and the writer.
class Run {
   public:
    Run(transport::Transport& transport, const RunOptions& options, const CancellationToken& cancel,
        std::string_view resource, Plan plan)
        : transport_(transport),
          options_(options),
          cancel_(cancel),
          resource_(resource),
          plan_(std::move(plan)),
          backend_(backend::make_backend(options.backend)) {}

    auto open(const io::OutputTarget& target) -> Result<void> {
        if (auto ok = new_builder(); !ok) {
            return ok;
        }
        auto output = options_.output;
        output.target = target;
        auto writer = backend_->make_writer(std::move(output));
        if (!writer) {
            return std::unexpected(writer.error());
        }
        writer_ = std::move(*writer);
        return {};
    }

    auto execute() -> Result<RunSummary> {
        next_ = transport::PageToken{.consumed = 0, .page_size = options_.page_size};
        if (auto ok = issue(); !ok) {
            return fail(ok.error());
        }

        std::size_t page_index = 0;
        while (!inflight_.empty()) {
            if (cancel_.cancelled()) {
                spdlog::info("{}: cancelled after {} page(s)", resource_, summary_.pages_fetched);
                summary_.cancelled = true;
                break;
            }
            auto page = wait_for(inflight_.front());
            inflight_.pop_front();
            if (!page) {
                return fail(tag(std::move(page).error(), resource_, page_index));
            }
            ++summary_.pages_fetched;

            const bool last = !page->next;
            auto received = append(*page);
            if (!received) {
                return fail(tag(std::move(received).error(), resource_, page_index));
            }
            spdlog::debug("{}: page {} gave {} of {} requested record(s)", resource_, page_index,
                          *received, page->requested);
            ++page_index;

            if (options_.max_rows_per_batch > 0 &&
                builder_->num_rows() >= options_.max_rows_per_batch) {
                if (auto ok = flush(); !ok) {
                    return fail(ok.error());
                }
                if (auto ok = new_builder(); !ok) {
                    return fail(ok.error());
                }
            }

            if (last || *received < page->requested) {
                break;
            }
            if (auto ok = issue(); !ok) {
                return fail(ok.error());
            }
        }

        // An empty listing still produces one (empty) batch so the output is
        // a valid, self-describing file.
        if (builder_->num_rows() > 0 || summary_.batches_flushed == 0) {
            if (auto ok = flush(); !ok) {
                return fail(ok.error());
            }
        }
        if (auto ok = writer_->close(); !ok) {
            return std::unexpected(tag(ok.error(), resource_));
        }
        return summary_;
    }

   private:
    /// Keep up to prefetch_pages + 1 page requests in flight.
    auto issue() -> Result<void> {
        const auto policy =
            options_.prefetch_pages == 0 ? std::launch::deferred : std::launch::async;
        while (next_ && inflight_.size() <= options_.prefetch_pages) {
            const auto token = *next_;
            try {
                inflight_.push_back(std::async(policy, [this, token] {
                    return transport_.fetch_page(resource_, plan_.descriptor, token);
                }));
            } catch (const std::exception& e) {
                return std::unexpected(
                    internal_error(fmt::format("cannot start page fetch: {}", e.what())));
            }
            next_ = transport::next_token(plan_.descriptor, token);
        }
        return {};
    }

    /// Decode, re-check and append one page; returns the records received.
    auto append(const transport::Page& page) -> Result<std::size_t> {
        auto records = record::parse_page(page.bytes, transport_.wire_format(), *plan_.schema);
        if (!records) {
            return std::unexpected(records.error());
        }
        std::vector<record::RecordTree> kept;
        kept.reserve(records->size());
        for (auto& record : *records) {
            auto match = query::matches(plan_.descriptor, record);
            if (!match) {
                return std::unexpected(match.error());
            }
            if (*match) {
                kept.push_back(std::move(record));
            } else {
                ++summary_.records_filtered;
            }
        }
        if (auto rows = builder_->append_page(kept); !rows) {
            return std::unexpected(rows.error());
        }
        return records->size();
    }

    auto new_builder() -> Result<void> {
        auto builder = backend_->make_builder(plan_.output_schema,
                                              batch::BuildOptions{.flatten = options_.flatten});
        if (!builder) {
            return std::unexpected(tag(builder.error(), resource_));
        }
        builder_ = std::move(*builder);
        return {};
    }

    auto flush() -> Result<void> {
        auto batch = builder_->finalize();
        if (!batch) {
            return std::unexpected(tag(batch.error(), resource_));
        }
        if (auto ok = writer_->write(**batch); !ok) {
            return std::unexpected(tag(ok.error(), resource_));
        }
        summary_.rows_written += (*batch)->num_rows();
        ++summary_.batches_flushed;
        spdlog::debug("{}: flushed batch {} ({} rows)", resource_, summary_.batches_flushed,
                      (*batch)->num_rows());
        return {};
    }

    /// Abort the run. Batches already flushed stay in a properly closed file.
    auto fail(Error error) -> Result<RunSummary> {
        inflight_.clear();
        if (writer_) {
            if (auto closed = writer_->close(); !closed) {
                spdlog::warn("{}: cannot close output after failure: {}", resource_,
                             closed.error().format());
            }
        }
        return std::unexpected(std::move(error));
    }

    transport::Transport& transport_;
    const RunOptions& options_;
    const CancellationToken& cancel_;
    std::string_view resource_;
    Plan plan_;
    std::unique_ptr<backend::Backend> backend_;
    std::unique_ptr<batch::BatchBuilder> builder_;
    std::unique_ptr<io::BatchWriter> writer_;
    std::optional<transport::PageToken> next_;
    std::deque<PageFuture> inflight_;
    RunSummary summary_;
};

}  // namespace

Engine::Engine(transport::Transport& transport, RunOptions options)
    : transport_(transport), options_(std::move(options)) {}

auto Engine::resolve(std::string_view resource) -> Result<Schema> {
    auto bytes = transport_.fetch_schema(resource);
    if (!bytes) {
        return std::unexpected(tag(bytes.error(), resource));
    }
    return schema::resolve_schema(resource, *bytes, options_.resolve);
}

auto Engine::prepare(std::string_view resource, const query::Constraints& constraints)
    -> Result<Plan> {
    auto resolved = resolve(resource);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (constraints.language) {
        resolved = schema::collapse_translations(*resolved);
        if (!resolved) {
            return std::unexpected(tag(resolved.error(), resource));
        }
    }
    auto schema = std::make_shared<const Schema>(std::move(*resolved));

    auto descriptor = query::build_query(*schema, constraints);
    if (!descriptor) {
        return std::unexpected(tag(descriptor.error(), resource));
    }

    auto output_schema = schema;
    if (descriptor->selected_fields) {
        auto projected = schema->project(*descriptor->selected_fields);
        if (!projected) {
            return std::unexpected(tag(projected.error(), resource));
        }
        output_schema = std::make_shared<const Schema>(std::move(*projected));
    }
    return Plan{.schema = std::move(schema),
                .output_schema = std::move(output_schema),
                .descriptor = std::move(*descriptor)};
}

auto Engine::run(std::string_view resource, const query::Constraints& constraints,
                 const io::OutputTarget& target) -> Result<RunSummary> {
    if (options_.page_size == 0) {
        return std::unexpected(config_error("page size must be positive", "page_size"));
    }
    auto plan = prepare(resource, constraints);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    spdlog::debug("{}: output layout has {} field(s), {} filter(s)", resource,
                  plan->output_schema->size(), plan->descriptor.filters.size());

    Run run(transport_, options_, cancel_, resource, std::move(*plan));
    if (auto ok = run.open(target); !ok) {
        return std::unexpected(ok.error());
    }
    auto summary = run.execute();
    if (summary) {
        spdlog::info("{}: wrote {} row(s) in {} batch(es) from {} page(s){}", resource,
                     summary->rows_written, summary->batches_flushed, summary->pages_fetched,
                     summary->cancelled ? " (cancelled)" : "");
        if (summary->records_filtered > 0) {
            spdlog::info("{}: {} record(s) did not match the filters", resource,
                         summary->records_filtered);
        }
    }
    return summary;
}

}  // namespace wsarrow::engine
