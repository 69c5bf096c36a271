// NEBULA - Price Feed Reader
// Copyright (c) 2024 NEBULA Developers
// MIT License

#ifndef NEBULA_ORACLE_FEED_READER_H
#define NEBULA_ORACLE_FEED_READER_H

#include <nebula/core/types.h>
#include <nebula/oracle/decimals.h>
#include <nebula/oracle/interfaces.h>

namespace nebula {
namespace oracle {

/**
 * Reads external price feeds and lifts their answers to 18 decimals.
 *
 * Feed decimals are taken from the normalizer's cache, filled once when the
 * feed is registered. No staleness check is made on `updatedAt`; a feed is
 * trusted to report a live price.
 */
class PriceFeedReader {
public:
    PriceFeedReader(const IChainView& chain, const DecimalNormalizer& normalizer);

    /**
     * Latest answer of `feed` in 18-decimal fixed point.
     *
     * @throws OracleError UnknownContract if no feed lives at the address,
     *         InvalidFeedValue if the answer is negative
     */
    UInt256 LatestPrice(const Address& feed) const;

    /// Raw latest round of `feed`
    RoundData LatestRound(const Address& feed) const;

private:
    const IChainView& chain_;
    const DecimalNormalizer& normalizer_;
};

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_FEED_READER_H
