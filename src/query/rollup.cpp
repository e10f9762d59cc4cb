// src/query/rollup.cpp

#include "histshard/query/rollup.hpp"
#include <algorithm>
#include "histshard/core/time_utils.hpp"

namespace histshard {

RollupStream::RollupStream(std::unique_ptr<BarStream> source, Granularity target)
    : source_(std::move(source)), target_(target) {}

int64_t RollupStream::bucket_of(const Timestamp& ts) const {
    int64_t ms = core::to_epoch_ms(ts);
    int64_t width = target_.millis();
    int64_t bucket = ms / width;
    if (ms % width != 0 && ms < 0) {
        --bucket;
    }
    return bucket * width;
}

void RollupStream::start(const Bar& bar) {
    acc_ = Accumulator{};
    acc_.active = true;
    acc_.bucket_ms = bucket_of(bar.timestamp);
    acc_.symbol = bar.symbol;
    acc_.open_ts = bar.timestamp;
    acc_.close_ts = bar.timestamp;
    acc_.open = bar.open;
    acc_.close = bar.close;
    acc_.high = bar.high;
    acc_.low = bar.low;
    acc_.volume = 0;
    add(bar);
}

void RollupStream::add(const Bar& bar) {
    if (bar.timestamp < acc_.open_ts) {
        acc_.open_ts = bar.timestamp;
        acc_.open = bar.open;
    }
    if (bar.timestamp >= acc_.close_ts) {
        acc_.close_ts = bar.timestamp;
        acc_.close = bar.close;
    }
    acc_.high = std::max(acc_.high, bar.high);
    acc_.low = std::min(acc_.low, bar.low);
    acc_.volume += bar.volume;

    if (bar.trade_count) {
        acc_.trade_count = acc_.trade_count.value_or(0) + *bar.trade_count;
    }

    if (bar.vwap) {
        acc_.vwap_notional += *bar.vwap * static_cast<double>(bar.volume);
        acc_.vwap_volume += bar.volume;
        acc_.vwap_bars++;
        if (!acc_.latest_vwap || bar.timestamp >= acc_.latest_vwap_ts) {
            acc_.latest_vwap = bar.vwap;
            acc_.latest_vwap_ts = bar.timestamp;
        }
    }
}

Bar RollupStream::finish() {
    Bar bar(core::from_epoch_ms(acc_.bucket_ms), acc_.open, acc_.high, acc_.low, acc_.close,
            acc_.volume, acc_.symbol);
    bar.trade_count = acc_.trade_count;

    if (acc_.vwap_bars == 1 || (acc_.vwap_bars > 1 && acc_.vwap_volume == 0)) {
        // A lone VWAP passes through unchanged so re-bucketing is exact
        bar.vwap = acc_.latest_vwap;
    } else if (acc_.vwap_bars > 1) {
        bar.vwap = acc_.vwap_notional / static_cast<double>(acc_.vwap_volume);
    }

    acc_.active = false;
    return bar;
}

Result<bool> RollupStream::next(Bar& out) {
    if (exhausted_) {
        return Result<bool>(false);
    }

    Bar bar;
    while (true) {
        auto step = source_->next(bar);
        if (step.is_error()) {
            return forward_error<bool>(step.error());
        }

        if (!step.value()) {
            exhausted_ = true;
            if (acc_.active) {
                out = finish();
                return Result<bool>(true);
            }
            return Result<bool>(false);
        }

        if (!acc_.active) {
            start(bar);
            continue;
        }

        if (bucket_of(bar.timestamp) == acc_.bucket_ms) {
            add(bar);
            continue;
        }

        out = finish();
        start(bar);
        return Result<bool>(true);
    }
}

Result<Granularity> RollupResolver::select_source(const Granularity& target,
                                                  const std::vector<Granularity>& available) {
    if (std::find(available.begin(), available.end(), target) != available.end()) {
        return Result<Granularity>(target);
    }

    std::vector<Granularity> sorted = available;
    std::sort(sorted.begin(), sorted.end());
    for (const auto& candidate : sorted) {
        if (candidate.divides(target)) {
            return Result<Granularity>(candidate);
        }
    }

    std::string stored;
    for (const auto& g : sorted) {
        stored += (stored.empty() ? "" : ", ") + g.to_string();
    }
    return make_error<Granularity>(ErrorCode::UNSUPPORTED_GRANULARITY,
                                   "Cannot derive " + target.to_string() + " bars from stored [" +
                                       stored + "]",
                                   "RollupResolver");
}

std::unique_ptr<BarStream> RollupResolver::rollup(std::unique_ptr<BarStream> source,
                                                  const Granularity& target) {
    return std::make_unique<RollupStream>(std::move(source), target);
}

}  // namespace histshard
