#include "safemeta/batch_strip.h"

#include <atomic>
#include <system_error>
#include <thread>
#include <utility>

namespace safemeta {
namespace {

    static void strip_one(std::span<const std::byte> image,
                          const StripOptions& options, BatchItem* item) noexcept
    {
        StripResult r       = strip_metadata(image, options);
        item->bytes         = std::move(r.bytes);
        item->analysis      = r.analysis;
        item->status        = r.rewrite.status;
        item->used_fallback = r.used_fallback;
    }


    static uint32_t worker_count(const BatchOptions& options,
                                 size_t items) noexcept
    {
        uint32_t n = options.max_workers;
        if (n == 0) {
            n = std::thread::hardware_concurrency();
            if (n == 0) {
                n = 1;
            }
        }
        if (static_cast<size_t>(n) > items) {
            n = static_cast<uint32_t>(items);
        }
        return n == 0 ? 1U : n;
    }

}  // namespace

BatchResult
strip_batch(std::span<const std::span<const std::byte>> images,
            const BatchOptions& options) noexcept
{
    BatchResult result;
    result.items.resize(images.size());

    std::atomic<size_t> next { 0 };
    auto run = [&]() noexcept {
        for (;;) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= images.size()) {
                return;
            }
            strip_one(images[i], options.strip, &result.items[i]);
        }
    };

    const uint32_t workers = worker_count(options, images.size());
    std::vector<std::thread> threads;
    if (workers > 1) {
        threads.reserve(workers - 1U);
        for (uint32_t w = 1; w < workers; ++w) {
            try {
                threads.emplace_back(run);
            } catch (const std::system_error&) {
                // Out of threads: the remaining workers share the queue.
                break;
            }
        }
    }
    run();
    for (std::thread& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < result.items.size(); ++i) {
        if (result.items[i].status != RewriteStatus::Ok) {
            result.failed_indices.push_back(i);
        }
    }
    return result;
}


PrivacyAnalysis
overall_privacy_analysis(const BatchResult& result) noexcept
{
    PrivacyAnalysis all;
    for (const BatchItem& item : result.items) {
        all = merge_privacy_analysis(all, item.analysis);
    }
    return all;
}


bool
has_processing_errors(const BatchResult& result) noexcept
{
    return !result.failed_indices.empty();
}

}  // namespace safemeta
