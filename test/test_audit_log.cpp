#include "sale_doubles.hpp"
#include <doctest/doctest.h>

using namespace crowdit;

TEST_SUITE("Audit Log Tests") {
    TEST_CASE("Empty log starts at the root hash") {
        AuditLog log;
        CHECK(log.size() == 0);
        CHECK(log.head() == AuditLog::ROOT_HASH);
        auto verified = log.verify();
        REQUIRE(verified.is_ok());
        CHECK(verified.value());
    }

    TEST_CASE("Entries chain from previous hashes") {
        AuditLog log;
        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "alice", 200, "Investment recorded"));
        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "bob", 300, "Investment recorded"));

        auto entries = log.entries();
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].sequence == 0);
        CHECK(entries[0].getPreviousHash() == AuditLog::ROOT_HASH);
        CHECK(entries[0].getHash().size() == 64);
        CHECK(entries[1].getPreviousHash() == entries[0].getHash());
        CHECK(log.head() == entries[1].getHash());
        CHECK(log.verify().is_ok());
    }

    TEST_CASE("Ledger events land in the audit log") {
        doubles::SaleFixture f;
        auto log = std::make_shared<AuditLog>();
        f.sale->subscribe(log);

        CHECK(f.invest("alice", 200).is_ok());
        CHECK(f.invest("bob", 300).is_ok());
        CHECK(f.sale->finalize("owner").is_ok());
        CHECK(f.sale->refund("alice").is_ok());

        CHECK(log->size() == 4);
        auto alice = log->entriesFor("alice");
        REQUIRE(alice.size() == 2);
        CHECK(alice[0].event.getType() == SaleEventType::InvestmentRecorded);
        CHECK(alice[1].event.getType() == SaleEventType::RefundIssued);
        CHECK(alice[1].event.amount == 200);
        CHECK(log->verify().is_ok());
    }

    TEST_CASE("Rejected operations leave no audit trace") {
        doubles::SaleFixture f;
        auto log = std::make_shared<AuditLog>();
        f.sale->subscribe(log);

        CHECK(f.sale->invest("alice", 0).is_err());
        CHECK(f.sale->finalize("mallory").is_err());
        CHECK(f.sale->refund("alice").is_err());
        CHECK(log->size() == 0);
    }

    TEST_CASE("Tampering is detected after a round trip") {
        AuditLog log;
        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "alice", 200, "Investment recorded"));
        log.publish(SaleEvent(SaleEventType::RefundIssued, "alice", 200, "Refund issued"));

        auto restored = AuditLog::fromBytes(log.toBytes());
        REQUIRE(restored.is_ok());
        CHECK(restored.value().size() == 2);
        CHECK(restored.value().head() == log.head());
        CHECK(restored.value().verify().is_ok());

        auto entries = log.entries();
        entries[0].event.amount = 2000;
        auto forged = AuditLog::fromEntries(entries).verify();
        REQUIRE(forged.is_err());
        CHECK(hasCode(forged.error(), ERR_SNAPSHOT_CORRUPT));
        CHECK(std::string(forged.error().message.c_str()).find("entry 0") != std::string::npos);

        auto reordered = log.entries();
        std::swap(reordered[0], reordered[1]);
        CHECK(AuditLog::fromEntries(reordered).verify().is_err());
    }

    TEST_CASE("Garbage bytes are rejected") {
        std::vector<uint8_t> garbage = {0x01, 0x02, 0x03};
        auto result = AuditLog::fromBytes(garbage);
        CHECK(result.is_err());
    }

    TEST_CASE("Events that cannot be hashed are not recorded") {
        bool hasher_online = false;
        AuditLog log([&hasher_online](const std::vector<uint8_t> &data) {
            if (!hasher_online)
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(dp::Error::io_error("hasher offline"));
            return sha256(data);
        });

        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "alice", 100, "alice invested"));
        CHECK(log.size() == 0);
        REQUIRE(log.lastError().has_value());
        CHECK(log.lastError()->code == dp::Error::io_error("").code);
        CHECK(log.head() == AuditLog::ROOT_HASH);

        hasher_online = true;
        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "bob", 200, "bob invested"));
        REQUIRE(log.size() == 1);
        CHECK(log.entries()[0].sequence == 0);
        CHECK(log.entries()[0].getPreviousHash() == AuditLog::ROOT_HASH);
        CHECK(log.entries()[0].event.getAccount() == "bob");
        CHECK(log.verify().is_ok());
    }

    TEST_CASE("Healthy log reports no hashing failure") {
        AuditLog log;
        log.publish(SaleEvent(SaleEventType::InvestmentRecorded, "alice", 100, "alice invested"));
        CHECK(log.size() == 1);
        CHECK_FALSE(log.lastError().has_value());
    }
}
