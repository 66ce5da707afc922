//
// Created by Malik T on 10/10/2026.
//

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/Card.hpp"
#include "core/Dealer.hpp"
#include "core/Deck.hpp"
#include "core/Exception.hpp"
#include "core/HandEvaluator.hpp"
#include "core/Round.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"

namespace
{
    using namespace drawpoker::core;

    enum class Mode : std::uint8_t
    {
        Help,
        Eval,
        Deal,
        Round,
        Seed
    };

    struct CliConfig
    {
        Mode mode{Mode::Help};
        Config engine{};
        std::vector<std::string> tokens{};
    };

    // "0,3,5" -> {0,3,5}; unparsable pieces are dropped, the engine skips bad indices anyway
    auto ParseIndexList(std::string_view s) -> std::vector<int>
    {
        std::vector<int> out;
        while (!s.empty())
        {
            std::size_t const comma = s.find(',');
            std::string_view const part = s.substr(0, comma);
            int v{};
            auto const res = std::from_chars(part.data(), part.data() + part.size(), v);
            if (res.ec == std::errc{} && res.ptr == part.data() + part.size()) out.push_back(v);
            if (comma == std::string_view::npos) break;
            s.remove_prefix(comma + 1);
        }
        return out;
    }

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};
        if (argc < 2) return cfg;

        std::string_view const cmd = argv[1];
        if (cmd == "eval") cfg.mode = Mode::Eval;
        else if (cmd == "deal") cfg.mode = Mode::Deal;
        else if (cmd == "round") cfg.mode = Mode::Round;
        else if (cmd == "seed") cfg.mode = Mode::Seed;
        else return cfg;

        for (int i = 2; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--seed")
            {
                next_str(cfg.engine.seed);
            }
            else if (arg == "--p1")
            {
                std::string v;
                if (next_str(v)) { cfg.engine.p1_discards = ParseIndexList(v); }
            }
            else if (arg == "--p2")
            {
                std::string v;
                if (next_str(v)) { cfg.engine.p2_discards = ParseIndexList(v); }
            }
            else if (arg == "--log")
            {
                next_str(cfg.engine.audit_path);
            }
            else
            {
                cfg.tokens.push_back(std::move(arg));
            }
        }
        return cfg;
    }

    auto JoinTokens(std::span<Card const> cards) -> std::string
    {
        std::string s;
        for (std::string const& t : ToTokens(cards))
        {
            s += (s.empty() ? "" : " ");
            s += t;
        }
        return s;
    }

    auto PrintHand(std::string_view label, HandResult const& h) -> void
    {
        std::string keys;
        for (int const k : h.HighCards())
        {
            keys += (keys.empty() ? "" : ",");
            keys += std::to_string(k);
        }
        std::print("{}: {} (rank {}) [{}] keys=[{}]\n", label, h.Name(), h.Rank(), JoinTokens(h.cards), keys);
    }

    auto PrintUsage() -> void
    {
        std::print("usage:\n"
                   "  drawpoker eval <card> <card> <card> <card> <card> [...]\n"
                   "  drawpoker deal --seed <seed>\n"
                   "  drawpoker round [--seed <seed>] [--p1 i,j,..] [--p2 i,j,..] [--log <file>]\n"
                   "  drawpoker seed\n");
    }

    auto RunRound(Config cfg) -> int
    {
        if (cfg.seed.empty()) cfg.seed = GenerateRoundSeed();

        DealtHands const dealt = DealHands(cfg.seed);
        debug::CheckDealInvariants(dealt);

        std::print("[drawpoker] seed {}\n", cfg.seed);
        std::print("P1 dealt: {}\n", JoinTokens(dealt.player1));
        std::print("P2 dealt: {}\n", JoinTokens(dealt.player2));

        for (SeatIdxT seat = 0; seat < 2; ++seat)
        {
            std::vector<int> const& req = seat == 0 ? cfg.p1_discards : cfg.p2_discards;
            if (auto const ok = ValidateDiscards(seat, req); !ok.has_value())
            {
                // reported, then applied anyway: ApplyDraw skips what it cannot honour
                std::print("{}\n", error::describe(ok.error()));
            }
        }

        std::optional<debug::AuditLogger> log{};
        if (!cfg.audit_path.empty())
        {
            log.emplace(cfg.audit_path);
            if (!log->ok())
                DPK_THROW(error::Code::Unknown, "Cannot open audit log " + cfg.audit_path);
            log->start(cfg.seed, dealt);
        }

        // player 1 draws first, player 2 continues where the reserve was left
        std::size_t const p2_cursor = ReserveCursorAfter(cfg.p1_discards);
        Hand const p1 = ApplyDraw(dealt.player1, cfg.p1_discards, dealt.reserve, 0);
        Hand const p2 = ApplyDraw(dealt.player2, cfg.p2_discards, dealt.reserve, p2_cursor);
        debug::CheckHandInvariants(p1);
        debug::CheckHandInvariants(p2);

        if (log)
        {
            log->draw(0, cfg.p1_discards, 0, p1);
            log->draw(1, cfg.p2_discards, p2_cursor, p2);
        }

        RoundOutcome const out = ResolveRound(p1, p2);
        PrintHand("P1", out.player1_hand);
        PrintHand("P2", out.player2_hand);
        if (out.is_tie) std::print("Result: tie\n");
        else std::print("Result: {} wins\n", to_string(out.winner));

        if (log) log->outcome(out);
        return 0;
    }
}

int main(int argc, char** argv)
{
    using namespace drawpoker::core;

    CliConfig const cfg = ParseArgs(argc, argv);

    try
    {
        switch (cfg.mode)
        {
        case Mode::Eval:
        {
            std::vector<Card> const cards = ParseCards(cfg.tokens);
            PrintHand("Best", BestHand(cards));
            return 0;
        }
        case Mode::Deal:
        {
            if (cfg.engine.seed.empty())
            {
                PrintUsage();
                return 2;
            }
            DealtHands const dealt = DealHands(cfg.engine.seed);
            debug::CheckDealInvariants(dealt);
            std::print("P1: {}\nP2: {}\nReserve: {} cards\n",
                       JoinTokens(dealt.player1), JoinTokens(dealt.player2), dealt.reserve.size());
            return 0;
        }
        case Mode::Round:
            return RunRound(cfg.engine);
        case Mode::Seed:
            std::print("{}\n", GenerateRoundSeed());
            return 0;
        case Mode::Help:
            PrintUsage();
            return 2;
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    return 0;
}
