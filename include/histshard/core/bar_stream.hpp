// include/histshard/core/bar_stream.hpp
#pragma once

#include <memory>
#include <vector>
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"

namespace histshard {

/**
 * @brief Forward-only source of bars in non-decreasing timestamp order
 *
 * Shard cursors, the cross-shard merge and the rollup all expose this
 * interface so they can be chained without materializing rows.
 */
class BarStream {
public:
    virtual ~BarStream() = default;

    /**
     * @brief Advance to the next bar
     * @param out Receives the bar when one is available
     * @return true if a bar was written, false at end of stream, or an error
     */
    virtual Result<bool> next(Bar& out) = 0;
};

/**
 * @brief BarStream over bars already held in memory
 */
class VectorBarStream : public BarStream {
public:
    explicit VectorBarStream(std::vector<Bar> bars) : bars_(std::move(bars)) {}

    Result<bool> next(Bar& out) override {
        if (position_ >= bars_.size()) {
            return Result<bool>(false);
        }
        out = bars_[position_++];
        return Result<bool>(true);
    }

private:
    std::vector<Bar> bars_;
    size_t position_{0};
};

/**
 * @brief Drain a stream into a vector
 * @param stream Source stream
 * @return All remaining bars or the first error raised by the stream
 */
inline Result<std::vector<Bar>> collect_bars(BarStream& stream) {
    std::vector<Bar> bars;
    Bar bar;
    while (true) {
        auto step = stream.next(bar);
        if (step.is_error()) {
            return forward_error<std::vector<Bar>>(step.error());
        }
        if (!step.value()) {
            break;
        }
        bars.push_back(std::move(bar));
    }
    return Result<std::vector<Bar>>(std::move(bars));
}

}  // namespace histshard
