//
// Created by Malik T on 08/10/2026.
//

#ifndef DRAWPOKER_AUDITLOGGER_HPP
#define DRAWPOKER_AUDITLOGGER_HPP

#include <cstddef>
#include <fstream>
#include <span>
#include <string>
#include <string_view>

#include "../core/Dealer.hpp"
#include "../core/HandResult.hpp"
#include "../core/Round.hpp"
#include "../core/Types.hpp"

namespace drawpoker::core::debug
{
    // Plain-text transcript of one or more rounds, one record per line.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto ok() const -> bool { return out_.good(); }

        // Round header (seed) and the initial deal
        auto start(std::string_view seed, DealtHands const& dealt) -> void;

        // One seat's draw: requested indices, the reserve cursor it drew from, resulting hand
        auto draw(SeatIdxT seat,
                  std::span<int const> discards,
                  std::size_t reserve_cursor,
                  std::span<Card const> hand) -> void;

        // Both best hands and the winner
        auto outcome(RoundOutcome const& r) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //DRAWPOKER_AUDITLOGGER_HPP
