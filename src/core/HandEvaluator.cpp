//
// Created by Malik T on 05/10/2026.
//

#include "HandEvaluator.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include "Card.hpp"
#include "Exception.hpp"
#include "Round.hpp"

namespace drawpoker::core
{
    namespace
    {
        using RankCounts = std::array<std::uint8_t, RankCount>;

        inline auto Val(Card const& c) -> std::uint8_t
        {
            return static_cast<std::uint8_t>(RankValue(c.rank));
        }

        auto CountRanks(std::span<Card const> const cards) -> RankCounts
        {
            RankCounts counts{};
            for (Card const& c : cards) ++counts[std::to_underlying(c.rank)];
            return counts;
        }

        // Highest rank with count >= min_count, skipping `except`
        auto HighestWithCount(RankCounts const& counts, std::uint8_t const min_count,
                              std::optional<Rank> const except = std::nullopt) -> std::optional<Rank>
        {
            for (std::size_t i = RankCount; i-- > 0;)
            {
                auto const r = static_cast<Rank>(i);
                if (except && *except == r) continue;
                if (counts[i] >= min_count) return r;
            }
            return std::nullopt;
        }

        auto HighestWithExactCount(RankCounts const& counts, std::uint8_t const count) -> std::optional<Rank>
        {
            for (std::size_t i = RankCount; i-- > 0;)
            {
                if (counts[i] == count) return static_cast<Rank>(i);
            }
            return std::nullopt;
        }

        auto Suited(std::span<Card const> const sorted, Suit const s) -> std::vector<Card>
        {
            std::vector<Card> out;
            for (Card const& c : sorted)
                if (c.suit == s) out.push_back(c);
            return out;
        }

        // Collects the hand's five cards: grouped ranks first, then kickers from canonical order.
        class FiveBuilder
        {
        public:
            explicit FiveBuilder(std::span<Card const> sorted) : sorted_(sorted) {}

            auto TakeRank(Rank const r, std::size_t const n) -> FiveBuilder&
            {
                std::size_t taken{};
                for (Card const& c : sorted_)
                {
                    if (taken == n) break;
                    if (c.rank != r) continue;
                    Push(c);
                    ++taken;
                }
                used_.push_back(r);
                return *this;
            }

            // Fills the remaining slots with the best cards whose rank was not grouped.
            auto TakeKickers() -> FiveBuilder&
            {
                for (Card const& c : sorted_)
                {
                    if (count_ == out_.size()) break;
                    if (std::ranges::find(used_, c.rank) != used_.end()) continue;
                    Push(c);
                }
                return *this;
            }

            // Everything pushed after this call counts as a kicker
            auto MarkKickers() -> FiveBuilder&
            {
                kicker_start_ = count_;
                return *this;
            }

            [[nodiscard]]
            auto Kicker(std::size_t const i) const -> std::uint8_t { return Val(out_[kicker_start_ + i]); }

            [[nodiscard]]
            auto Cards() const -> FiveCards
            {
                DPK_ASSERT(count_ == out_.size(), "Hand builder finished with fewer than five cards");
                return out_;
            }

        private:
            auto Push(Card const& c) -> void
            {
                DPK_ASSERT(count_ < out_.size(), "Hand builder overflow");
                out_[count_++] = c;
            }

            std::span<Card const> sorted_;
            FiveCards out_{};
            std::size_t count_{};
            std::size_t kicker_start_{};
            std::vector<Rank> used_{};
        };

        auto ValuesOf(FiveCards const& cards) -> std::array<std::uint8_t, 5>
        {
            std::array<std::uint8_t, 5> v{};
            for (std::size_t i{}; i < cards.size(); ++i) v[i] = Val(cards[i]);
            return v;
        }

        auto FirstFive(std::span<Card const> const sorted) -> FiveCards
        {
            FiveCards out{};
            std::ranges::copy(sorted.first(constants::EvalSize), out.begin());
            return out;
        }

        auto FindStraightFlush(std::span<Card const> const sorted) -> std::optional<FiveCards>
        {
            std::optional<FiveCards> best{};
            for (Suit const s : AllSuits())
            {
                std::vector<Card> const suited = Suited(sorted, s);
                if (suited.size() < constants::EvalSize) continue;
                std::optional<FiveCards> const run = straight::Find(suited);
                if (run && (!best || Val((*run)[0]) > Val((*best)[0]))) best = run;
            }
            return best;
        }

        auto FindFlush(std::span<Card const> const sorted) -> std::optional<FiveCards>
        {
            std::optional<FiveCards> best{};
            for (Suit const s : AllSuits())
            {
                std::vector<Card> const suited = Suited(sorted, s);
                if (suited.size() < constants::EvalSize) continue;
                FiveCards const top = FirstFive(suited);
                if (!best || ValuesOf(top) > ValuesOf(*best)) best = top;
            }
            return best;
        }
    }

    auto CanonicalOrder(std::span<Card const> const cards) -> std::vector<Card>
    {
        std::vector<Card> sorted(cards.begin(), cards.end());
        std::ranges::sort(sorted, [](Card const& a, Card const& b)
        {
            if (a.rank != b.rank) return a.rank > b.rank;
            return a.suit < b.suit;
        });
        return sorted;
    }

    namespace straight
    {
        auto DistinctRanks(std::span<Card const> const sorted) -> std::vector<Card>
        {
            std::vector<Card> out;
            for (Card const& c : sorted)
            {
                if (out.empty() || out.back().rank != c.rank) out.push_back(c);
            }
            return out;
        }

        auto ScanRun(std::span<Card const> const distinct) -> std::optional<FiveCards>
        {
            if (distinct.size() < constants::EvalSize) return std::nullopt;

            for (std::size_t i{}; i + constants::EvalSize <= distinct.size(); ++i)
            {
                bool consecutive = true;
                for (std::size_t j{}; j + 1 < constants::EvalSize; ++j)
                {
                    if (Val(distinct[i + j]) - Val(distinct[i + j + 1]) != 1)
                    {
                        consecutive = false;
                        break;
                    }
                }
                if (consecutive) return FirstFive(distinct.subspan(i));
            }
            return std::nullopt;
        }

        auto ScanWheel(std::span<Card const> const distinct) -> std::optional<FiveCards>
        {
            constexpr std::array<Rank, 5> wheel{Rank::Five, Rank::Four, Rank::Three, Rank::Two, Rank::Ace};

            FiveCards out{};
            for (std::size_t i{}; i < wheel.size(); ++i)
            {
                auto const it = std::ranges::find(distinct, wheel[i], &Card::rank);
                if (it == distinct.end()) return std::nullopt;
                out[i] = *it;
            }
            return out;
        }

        auto Find(std::span<Card const> const sorted) -> std::optional<FiveCards>
        {
            std::vector<Card> const distinct = DistinctRanks(sorted);
            if (std::optional<FiveCards> run = ScanRun(distinct)) return run;
            return ScanWheel(distinct);
        }
    }

    auto Evaluate(std::span<Card const> const cards) -> HandResult
    {
        if (cards.size() < constants::EvalSize)
            DPK_THROW(error::Code::InsufficientCards,
                      std::format("Need at least 5 cards to evaluate a hand, got {}", cards.size()));

        std::vector<Card> const sorted = CanonicalOrder(cards);

        if (std::optional<FiveCards> const sf = FindStraightFlush(sorted))
        {
            std::uint8_t const high = Val((*sf)[0]);
            if (high == RankValue(Rank::Ace)) return HandResult{RoyalFlush{}, *sf};
            return HandResult{StraightFlush{high}, *sf};
        }

        RankCounts const counts = CountRanks(sorted);

        if (std::optional<Rank> const quads = HighestWithExactCount(counts, 4))
        {
            FiveBuilder b{sorted};
            b.TakeRank(*quads, 4).MarkKickers().TakeKickers();
            return HandResult{FourOfAKind{static_cast<std::uint8_t>(RankValue(*quads)), b.Kicker(0)}, b.Cards()};
        }

        std::optional<Rank> const trips = HighestWithCount(counts, 3);
        if (trips)
        {
            if (std::optional<Rank> const pair = HighestWithCount(counts, 2, trips))
            {
                FiveBuilder b{sorted};
                b.TakeRank(*trips, 3).TakeRank(*pair, 2);
                return HandResult{FullHouse{static_cast<std::uint8_t>(RankValue(*trips)),
                                            static_cast<std::uint8_t>(RankValue(*pair))},
                                  b.Cards()};
            }
        }

        if (std::optional<FiveCards> const flush = FindFlush(sorted))
        {
            return HandResult{Flush{ValuesOf(*flush)}, *flush};
        }

        if (std::optional<FiveCards> const run = straight::Find(sorted))
        {
            return HandResult{Straight{Val((*run)[0])}, *run};
        }

        if (trips)
        {
            FiveBuilder b{sorted};
            b.TakeRank(*trips, 3).MarkKickers().TakeKickers();
            return HandResult{ThreeOfAKind{static_cast<std::uint8_t>(RankValue(*trips)), b.Kicker(0), b.Kicker(1)},
                              b.Cards()};
        }

        std::vector<Rank> pairs;
        for (std::size_t i = RankCount; i-- > 0;)
            if (counts[i] == 2) pairs.push_back(static_cast<Rank>(i));

        if (pairs.size() >= 2)
        {
            FiveBuilder b{sorted};
            b.TakeRank(pairs[0], 2).TakeRank(pairs[1], 2).MarkKickers().TakeKickers();
            return HandResult{TwoPair{static_cast<std::uint8_t>(RankValue(pairs[0])),
                                      static_cast<std::uint8_t>(RankValue(pairs[1])),
                                      b.Kicker(0)},
                              b.Cards()};
        }

        if (pairs.size() == 1)
        {
            FiveBuilder b{sorted};
            b.TakeRank(pairs[0], 2).MarkKickers().TakeKickers();
            return HandResult{OnePair{static_cast<std::uint8_t>(RankValue(pairs[0])),
                                      b.Kicker(0), b.Kicker(1), b.Kicker(2)},
                              b.Cards()};
        }

        FiveCards const top = FirstFive(sorted);
        return HandResult{HighCard{ValuesOf(top)}, top};
    }

    auto BestHand(std::span<Card const> const cards) -> HandResult
    {
        std::size_t const n = cards.size();
        if (n < constants::EvalSize)
            DPK_THROW(error::Code::InsufficientCards,
                      std::format("Need at least 5 cards to find best hand, got {}", n));

        if (n == constants::EvalSize) return Evaluate(cards);

        std::optional<HandResult> best{};
        std::array<Card, 5> combo{};
        // lexicographic subset order; only a strictly better hand replaces the current best
        for (std::size_t a = 0; a < n; ++a)
        for (std::size_t b = a + 1; b < n; ++b)
        for (std::size_t c = b + 1; c < n; ++c)
        for (std::size_t d = c + 1; d < n; ++d)
        for (std::size_t e = d + 1; e < n; ++e)
        {
            combo = {cards[a], cards[b], cards[c], cards[d], cards[e]};
            HandResult hand = Evaluate(combo);
            if (!best || CompareHands(hand, *best) > 0) best = std::move(hand);
        }

        DPK_ASSERT(best.has_value(), "No five-card subset evaluated");
        return *best;
    }
}
