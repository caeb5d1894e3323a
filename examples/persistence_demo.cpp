#include <crowdit.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

using namespace crowdit;

int main() {
    std::cout << "=== Crowdsale Persistence Demo ===" << std::endl;

    const std::string path = "crowdit_demo_store";
    std::filesystem::remove_all(path);

    storage::SnapshotStore store;
    auto opened = store.open(path);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open store: " << opened.error().message.c_str() << std::endl;
        return 1;
    }

    SaleConfig config;
    config.owner = "founder";
    config.start_time = currentTimestamp();
    config.end_time = config.start_time + 3600;
    config.unit_price = 25;
    config.funding_objective = 5000;

    auto escrow = std::make_shared<EscrowAccount>();
    auto token = std::make_shared<LockedToken>();
    auto created = Crowdsale::create(config, escrow, token);
    if (!created.is_ok()) {
        std::cerr << "Failed to create sale: " << created.error().message.c_str() << std::endl;
        return 1;
    }
    auto sale = created.value();
    auto audit = std::make_shared<AuditLog>();
    sale->subscribe(audit);

    std::cout << "\n1. Collecting contributions..." << std::endl;
    const std::vector<std::pair<std::string, Amount>> pledges = {{"alice", 1200}, {"bob", 830}, {"carol", 95}};
    for (const auto &[who, amount] : pledges) {
        auto invested = sale->invest(who, amount);
        if (!invested.is_ok()) {
            std::cerr << "   Investment by " << who << " rejected: " << invested.error().message.c_str() << std::endl;
            continue;
        }
        auto deposited = escrow->deposit(who, amount);
        if (!deposited.is_ok()) {
            std::cerr << "   Escrow deposit failed: " << deposited.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "   " << who << " invested " << amount << std::endl;
    }
    if (!sale->finalize("founder").is_ok())
        return 1;

    std::cout << "\n2. Saving state..." << std::endl;
    if (!store.saveSnapshot(sale->snapshot()).is_ok() || !store.saveAuditLog(*audit).is_ok()) {
        std::cerr << "Failed to save state" << std::endl;
        return 1;
    }
    sale.reset();

    std::cout << "\n3. Restoring state..." << std::endl;
    auto snapshot = store.loadSnapshot();
    auto trail = store.loadAuditLog();
    if (!snapshot.is_ok() || !trail.is_ok()) {
        std::cerr << "Failed to load state" << std::endl;
        return 1;
    }
    auto restored = Crowdsale::restore(snapshot.value(), escrow, token);
    if (!restored.is_ok()) {
        std::cerr << "Failed to restore: " << restored.error().message.c_str() << std::endl;
        return 1;
    }
    sale = restored.value();
    auto resumed_audit = std::make_shared<AuditLog>(trail.value());
    sale->subscribe(resumed_audit);

    std::cout << "   State: " << saleStateToString(sale->state()) << ", outstanding refunds "
              << sale->outstandingRefunds() << std::endl;

    std::cout << "\n4. Paying refunds after restart..." << std::endl;
    for (const auto *who : {"alice", "bob", "carol"}) {
        auto result = sale->refund(who);
        std::cout << "   " << who << ": " << (result.is_ok() ? "refunded" : result.error().message.c_str())
                  << std::endl;
    }
    std::cout << "   Audit entries: " << resumed_audit->size()
              << ", chain valid: " << (resumed_audit->verify().is_ok() ? "YES" : "NO") << std::endl;

    std::filesystem::remove_all(path);
    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
