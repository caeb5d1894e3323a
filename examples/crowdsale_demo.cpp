#include <crowdit.hpp>
#include <iostream>
#include <memory>

using namespace crowdit;

namespace {

    SaleConfig demoConfig() {
        SaleConfig config;
        config.owner = "founder";
        config.start_time = currentTimestamp() + 60;
        config.end_time = config.start_time + 7 * 24 * 3600;
        config.unit_price = 100;
        config.funding_objective = 1000;
        return config;
    }

    bool contribute(Crowdsale &sale, EscrowAccount &escrow, const std::string &who, Amount amount) {
        auto result = sale.invest(who, amount);
        if (!result.is_ok()) {
            std::cerr << "   Investment by " << who << " rejected: " << result.error().message.c_str() << std::endl;
            return false;
        }
        auto deposited = escrow.deposit(who, amount);
        if (!deposited.is_ok()) {
            std::cerr << "   Escrow deposit failed: " << deposited.error().message.c_str() << std::endl;
            return false;
        }
        return true;
    }

} // namespace

int main() {
    std::cout << "=== Crowdsale Demo ===" << std::endl;

    // Example 1: objective met
    std::cout << "\n1. Sale reaching its objective..." << std::endl;
    auto escrow = std::make_shared<EscrowAccount>();
    auto created = Crowdsale::create(demoConfig(), escrow);
    if (!created.is_ok()) {
        std::cerr << "Failed to create sale: " << created.error().message.c_str() << std::endl;
        return 1;
    }
    auto sale = created.value();
    auto audit = std::make_shared<AuditLog>();
    sale->subscribe(audit);

    if (!contribute(*sale, *escrow, "alice", 450) || !contribute(*sale, *escrow, "bob", 700))
        return 1;
    std::cout << "   Total received: " << sale->totalReceived() << std::endl;

    auto rejected = sale->finalize("alice");
    std::cout << "   Finalize by alice: " << (rejected.is_ok() ? "accepted" : rejected.error().message.c_str())
              << std::endl;

    auto finalized = sale->finalize("founder");
    if (!finalized.is_ok()) {
        std::cerr << "   Finalize failed: " << finalized.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   State: " << saleStateToString(sale->state()) << std::endl;

    auto token = std::dynamic_pointer_cast<LockedToken>(sale->issuer());
    if (token) {
        std::cout << "   Units alice/bob: " << token->balanceOf("alice") << "/" << token->balanceOf("bob")
                  << " (released: " << (token->isReleased() ? "yes" : "no") << ")" << std::endl;
    }

    auto withdrawn = sale->withdraw("founder");
    if (withdrawn.is_ok()) {
        std::cout << "   Founder withdrew " << withdrawn.value() << std::endl;
    }

    // Example 2: objective missed
    std::cout << "\n2. Sale missing its objective..." << std::endl;
    auto refund_escrow = std::make_shared<EscrowAccount>();
    auto failing = Crowdsale::create(demoConfig(), refund_escrow);
    if (!failing.is_ok()) {
        std::cerr << "Failed to create sale: " << failing.error().message.c_str() << std::endl;
        return 1;
    }
    auto refunding = failing.value();
    refunding->subscribe(audit);

    if (!contribute(*refunding, *refund_escrow, "alice", 200) || !contribute(*refunding, *refund_escrow, "bob", 300))
        return 1;

    auto early = refunding->refund("alice");
    std::cout << "   Early refund: " << (early.is_ok() ? "paid" : early.error().message.c_str()) << std::endl;

    if (!refunding->finalize("founder").is_ok())
        return 1;
    std::cout << "   State: " << saleStateToString(refunding->state()) << std::endl;

    for (const auto &who : {"alice", "bob", "alice"}) {
        auto result = refunding->refund(who);
        if (result.is_ok()) {
            std::cout << "   " << who << " refunded, escrow paid " << refund_escrow->paidTo(who) << std::endl;
        } else {
            std::cout << "   " << who << " refund rejected: " << result.error().message.c_str() << std::endl;
        }
    }
    std::cout << "   Total refunded: " << refunding->totalRefunded() << std::endl;

    // Example 3: audit trail
    std::cout << "\n3. Audit trail..." << std::endl;
    for (const auto &entry : audit->entries()) {
        std::cout << "   #" << entry.sequence << " " << saleEventTypeToString(entry.event.getType()) << " "
                  << entry.event.getAccount() << " " << entry.event.amount << " " << entry.getHash().substr(0, 16)
                  << "..." << std::endl;
    }
    auto verified = audit->verify();
    std::cout << "   Chain valid: " << (verified.is_ok() ? "YES" : "NO") << std::endl;

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
