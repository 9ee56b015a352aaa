/**
Copyright 2025 IceStream Team
Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at
    http://www.apache.org/licenses/LICENSE-2.0
Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
 */

#ifndef ICESTREAM_TRANSACTIONSTATE_H
#define ICESTREAM_TRANSACTIONSTATE_H

#include <string>
#include <variant>

namespace icestream {

// A write to a brand new target is about to start
struct NewTransaction {
    std::string target;
};
// An append to the last valid target is about to start
struct AppendTransaction {};
// The in-flight write finished and its target is readable
struct CompleteTransaction {};
// The incomplete target was removed from the store
struct DeletedTransaction {};
// The incomplete target was reset to its last checkpoint and is valid again
struct RolledBackTransaction {};
// A target found by listing replaces the last valid pointer
struct AdoptTarget {
    std::string target;
};

using TransactionEvent = std::variant<NewTransaction, AppendTransaction, CompleteTransaction, DeletedTransaction,
                                      RolledBackTransaction, AdoptTarget>;

std::string transactionEventName(const TransactionEvent &event);

/**
 * The three target pointers tracked across runs. incompleteTarget is non-empty only while a write
 * is in flight or after a run died mid-write.
 */
struct TransactionState {
    std::string lastValidTarget;
    std::string penultimateValidTarget;
    std::string incompleteTarget;

    bool isClean() const { return incompleteTarget.empty(); }

    /**
     * Pure transition function. Throws std::logic_error when the event is not allowed in this state,
     * e.g. starting a transaction while another one is incomplete.
     */
    TransactionState apply(const TransactionEvent &event) const;

    bool operator==(const TransactionState &other) const {
        return lastValidTarget == other.lastValidTarget && penultimateValidTarget == other.penultimateValidTarget &&
               incompleteTarget == other.incompleteTarget;
    }
    bool operator!=(const TransactionState &other) const { return !(*this == other); }
};

}  // namespace icestream

#endif  // ICESTREAM_TRANSACTIONSTATE_H
