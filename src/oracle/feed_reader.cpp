// NEBULA - Price Feed Reader Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/feed_reader.h"
#include "nebula/core/errors.h"
#include "nebula/util/logging.h"

namespace nebula {
namespace oracle {

PriceFeedReader::PriceFeedReader(const IChainView& chain, const DecimalNormalizer& normalizer)
    : chain_(chain), normalizer_(normalizer) {}

RoundData PriceFeedReader::LatestRound(const Address& feed) const {
    auto source = chain_.GetFeed(feed);
    if (!source) {
        LOG_WARN(util::LogCategory::FEED) << "No price feed at " << feed.ToHex();
        throw OracleError(OracleErrc::UnknownContract, feed.ToHex());
    }
    return source->LatestRoundData();
}

UInt256 PriceFeedReader::LatestPrice(const Address& feed) const {
    RoundData round = LatestRound(feed);

    if (round.answer < 0) {
        LOG_ERROR(util::LogCategory::FEED) << "Feed " << feed.ToShortHex()
                                           << " reported negative answer " << round.answer
                                           << " in round " << round.roundId;
        throw OracleError(OracleErrc::InvalidFeedValue, feed.ToHex());
    }

    UInt256 price = normalizer_.Normalize(feed, static_cast<UInt256>(round.answer));
    LOG_TRACE(util::LogCategory::FEED) << "Feed " << feed.ToShortHex()
                                       << " round " << round.roundId << " price " << price;
    return price;
}

} // namespace oracle
} // namespace nebula
