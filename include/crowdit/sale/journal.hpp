#pragma once

#include "events.hpp"
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace crowdit {

    /// Undo journal scoping one ledger operation (RAII)
    ///
    /// Events are appended to the bound outbox as they are emitted, so nested operations keep
    /// emission order. Unless commit() is called, every change is undone in reverse order and
    /// the emitted events are withdrawn from the outbox.
    class Journal {
      public:
        explicit Journal(std::vector<SaleEvent> &outbox) : outbox_(outbox) {}

        inline ~Journal() {
            if (!committed_) {
                rollback();
            }
        }

        Journal(const Journal &) = delete;
        Journal &operator=(const Journal &) = delete;

        /// Overwrite a state slot, remembering its previous value
        template <typename T> inline void assign(T &slot, T value) {
            T previous = slot;
            undo_.push_back([&slot, previous]() { slot = previous; });
            slot = std::move(value);
        }

        /// Register a custom undo step
        inline void record(std::function<void()> undo) { undo_.push_back(std::move(undo)); }

        inline void emit(SaleEvent event) {
            auto position = static_cast<std::ptrdiff_t>(outbox_.size());
            outbox_.push_back(std::move(event));
            auto &outbox = outbox_;
            // Entries ahead of position are never removed while this journal is open
            undo_.push_back([&outbox, position]() { outbox.erase(outbox.begin() + position); });
        }

        inline void commit() {
            committed_ = true;
            undo_.clear();
        }

        inline void rollback() {
            for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
                (*it)();
            }
            undo_.clear();
            committed_ = true;
        }

        inline bool isCommitted() const { return committed_; }

      private:
        std::vector<SaleEvent> &outbox_;
        std::vector<std::function<void()>> undo_;
        bool committed_ = false;
    };

} // namespace crowdit
