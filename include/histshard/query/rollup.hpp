// include/histshard/query/rollup.hpp

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "histshard/core/bar_stream.hpp"
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Aggregates a time-ordered bar stream into coarser epoch-aligned buckets
 *
 * Single forward pass holding one bucket accumulator. Bucket bars are stamped
 * with the bucket start; empty buckets are never emitted. Input must be in
 * non-decreasing timestamp order.
 */
class RollupStream : public BarStream {
public:
    RollupStream(std::unique_ptr<BarStream> source, Granularity target);

    Result<bool> next(Bar& out) override;

private:
    struct Accumulator {
        bool active{false};
        int64_t bucket_ms{0};
        std::string symbol;
        Timestamp open_ts;
        Timestamp close_ts;
        Price open{0.0};
        Price close{0.0};
        Price high{0.0};
        Price low{0.0};
        int64_t volume{0};
        std::optional<int64_t> trade_count;
        double vwap_notional{0.0};
        int64_t vwap_volume{0};
        size_t vwap_bars{0};
        std::optional<Price> latest_vwap;
        Timestamp latest_vwap_ts;
    };

    int64_t bucket_of(const Timestamp& ts) const;
    void start(const Bar& bar);
    void add(const Bar& bar);
    Bar finish();

    std::unique_ptr<BarStream> source_;
    Granularity target_;
    Accumulator acc_;
    bool exhausted_{false};
};

/**
 * @brief Chooses source granularities and builds rollup streams
 */
class RollupResolver {
public:
    /**
     * @brief Pick the stored granularity to read for a requested one
     * @param target Requested granularity
     * @param available Natively stored granularities
     * @return The target itself when stored, otherwise the finest stored
     *         granularity that divides it evenly, otherwise UNSUPPORTED_GRANULARITY
     */
    static Result<Granularity> select_source(const Granularity& target,
                                             const std::vector<Granularity>& available);

    /**
     * @brief Wrap a stream so it yields target-width bars
     */
    static std::unique_ptr<BarStream> rollup(std::unique_ptr<BarStream> source,
                                             const Granularity& target);
};

}  // namespace histshard
