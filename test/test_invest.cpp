#include "sale_doubles.hpp"
#include <doctest/doctest.h>
#include <limits>

using namespace crowdit;

TEST_SUITE("Crowdsale Invest Tests") {
    TEST_CASE("Contributions accumulate per contributor and in total") {
        doubles::SaleFixture f;
        REQUIRE(f.sale != nullptr);

        CHECK(f.invest("alice", 300).is_ok());
        CHECK(f.invest("bob", 250).is_ok());
        CHECK(f.invest("alice", 150).is_ok());

        CHECK(f.sale->contributionOf("alice") == 450);
        CHECK(f.sale->contributionOf("bob") == 250);
        CHECK(f.sale->contributionOf("carol") == 0);
        CHECK(f.sale->totalReceived() == 700);
        CHECK(f.sale->contributorCount() == 2);
    }

    TEST_CASE("Units minted by integer division, remainder kept unconverted") {
        doubles::SaleFixture f;

        CHECK(f.invest("alice", 450).is_ok());
        CHECK(f.invest("bob", 99).is_ok());

        REQUIRE(f.issuer->mints.size() == 2);
        CHECK(f.issuer->mints[0].first == "alice");
        CHECK(f.issuer->mints[0].second == 4);
        CHECK(f.issuer->mints[1].first == "bob");
        CHECK(f.issuer->mints[1].second == 0);

        // The full amount is credited even though only 400 was converted
        CHECK(f.sale->contributionOf("alice") == 450);
    }

    TEST_CASE("Investment emits an event with contributor and amount") {
        doubles::SaleFixture f;
        CHECK(f.invest("alice", 450).is_ok());

        REQUIRE(f.sink->events.size() == 1);
        const auto &event = f.sink->events[0];
        CHECK(event.getType() == SaleEventType::InvestmentRecorded);
        CHECK(event.getAccount() == "alice");
        CHECK(event.amount == 450);
        CHECK(event.getMessage().find("alice") != std::string::npos);
    }

    TEST_CASE("Zero amount is rejected without touching state") {
        doubles::SaleFixture f;
        CHECK(f.invest("alice", 100).is_ok());

        auto result = f.sale->invest("alice", 0);
        REQUIRE(result.is_err());
        CHECK(hasCode(result.error(), ERR_INVALID_AMOUNT));

        CHECK(f.sale->totalReceived() == 100);
        CHECK(f.sale->contributionOf("alice") == 100);
        CHECK(f.issuer->mints.size() == 1);
        CHECK(f.sink->events.size() == 1);
    }

    TEST_CASE("Overflowing contribution is rejected") {
        doubles::SaleFixture f;
        CHECK(f.sale->invest("alice", std::numeric_limits<Amount>::max() - 10).is_ok());

        auto result = f.sale->invest("bob", 11);
        REQUIRE(result.is_err());
        CHECK(hasCode(result.error(), ERR_INVALID_AMOUNT));
        CHECK(f.sale->contributionOf("bob") == 0);
        CHECK(f.sale->totalReceived() == std::numeric_limits<Amount>::max() - 10);
    }

    TEST_CASE("Mint failure rolls the investment back") {
        doubles::SaleFixture f;
        CHECK(f.invest("alice", 200).is_ok());

        f.issuer->fail_mint = true;
        auto result = f.sale->invest("alice", 300);
        REQUIRE(result.is_err());
        CHECK(hasCode(result.error(), ERR_ISSUER_FAILED));

        auto fresh = f.sale->invest("bob", 300);
        REQUIRE(fresh.is_err());

        CHECK(f.sale->contributionOf("alice") == 200);
        CHECK(f.sale->contributionOf("bob") == 0);
        CHECK(f.sale->contributorCount() == 1);
        CHECK(f.sale->totalReceived() == 200);
        CHECK(f.sink->events.size() == 1);
    }

    TEST_CASE("Minted units reach the default locked token") {
        auto escrow = std::make_shared<EscrowAccount>();
        auto created = Crowdsale::create(doubles::config(), escrow, nullptr, doubles::NOW);
        REQUIRE(created.is_ok());
        auto sale = created.value();

        CHECK(sale->invest("alice", 1250).is_ok());

        auto token = std::dynamic_pointer_cast<LockedToken>(sale->issuer());
        REQUIRE(token != nullptr);
        CHECK(token->balanceOf("alice") == 12);
        CHECK(token->totalSupply() == 12);
    }

    TEST_CASE("Investment after finalization is still accepted") {
        doubles::SaleFixture f;
        CHECK(f.invest("alice", 200).is_ok());
        CHECK(f.sale->finalize("owner").is_ok());
        REQUIRE(f.sale->isRefundingAllowed());

        CHECK(f.invest("bob", 300).is_ok());
        CHECK(f.sale->totalReceived() == 500);
        CHECK(f.sale->state() == SaleState::Refunding);
    }

    TEST_CASE("Nested investment from the issuer is published after the outer one") {
        auto escrow = std::make_shared<EscrowAccount>();
        auto issuer = std::make_shared<doubles::ReentrantIssuer>();
        auto sink = std::make_shared<doubles::CollectingSink>();
        auto created = Crowdsale::create(doubles::config(), escrow, issuer, doubles::NOW);
        REQUIRE(created.is_ok());
        auto sale = created.value();
        sale->subscribe(sink);
        issuer->sale = sale;
        issuer->nested_investor = "bob";
        issuer->nested_amount = 300;

        REQUIRE(sale->invest("alice", 200).is_ok());

        CHECK(issuer->reentry_successes == 1);
        CHECK(sale->contributionOf("alice") == 200);
        CHECK(sale->contributionOf("bob") == 300);
        CHECK(sale->totalReceived() == 500);

        REQUIRE(sink->events.size() == 2);
        CHECK(sink->events[0].getAccount() == "alice");
        CHECK(sink->events[1].getAccount() == "bob");
    }

    TEST_CASE("Nested investment survives when the outer investment rolls back") {
        auto escrow = std::make_shared<EscrowAccount>();
        auto issuer = std::make_shared<doubles::ReentrantIssuer>();
        auto sink = std::make_shared<doubles::CollectingSink>();
        auto created = Crowdsale::create(doubles::config(), escrow, issuer, doubles::NOW);
        REQUIRE(created.is_ok());
        auto sale = created.value();
        sale->subscribe(sink);
        issuer->sale = sale;
        issuer->nested_investor = "bob";
        issuer->nested_amount = 300;
        issuer->fail_outer_mint = true;

        auto rejected = sale->invest("alice", 200);
        REQUIRE(rejected.is_err());
        CHECK(hasCode(rejected.error(), ERR_ISSUER_FAILED));

        CHECK(issuer->reentry_successes == 1);
        CHECK(sale->contributionOf("alice") == 0);
        CHECK(sale->contributionOf("bob") == 300);
        CHECK(sale->totalReceived() == 300);

        REQUIRE(sink->events.size() == 1);
        CHECK(sink->events[0].getAccount() == "bob");
        CHECK(sink->events[0].amount == 300);
    }
}
