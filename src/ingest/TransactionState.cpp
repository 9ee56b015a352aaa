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

#include "TransactionState.h"

#include <stdexcept>

namespace icestream {

static std::string eventName(const NewTransaction &) { return "new"; }
static std::string eventName(const AppendTransaction &) { return "append"; }
static std::string eventName(const CompleteTransaction &) { return "complete"; }
static std::string eventName(const DeletedTransaction &) { return "deleted"; }
static std::string eventName(const RolledBackTransaction &) { return "rolled-back"; }
static std::string eventName(const AdoptTarget &) { return "adopt"; }

std::string transactionEventName(const TransactionEvent &event) {
    return std::visit([](const auto &alternative) { return eventName(alternative); }, event);
}

TransactionState TransactionState::apply(const TransactionEvent &event) const {
    TransactionState next = *this;

    if (const auto *created = std::get_if<NewTransaction>(&event)) {
        if (!isClean()) {
            throw std::logic_error("Cannot start a new transaction while " + incompleteTarget + " is incomplete");
        }
        if (created->target.empty()) {
            throw std::logic_error("A new transaction needs a target");
        }
        next.penultimateValidTarget = lastValidTarget;
        next.incompleteTarget = created->target;
    } else if (std::holds_alternative<AppendTransaction>(event)) {
        if (!isClean()) {
            throw std::logic_error("Cannot append while " + incompleteTarget + " is incomplete");
        }
        if (lastValidTarget.empty()) {
            throw std::logic_error("Cannot append without a last valid target");
        }
        next.incompleteTarget = lastValidTarget;
        next.lastValidTarget = penultimateValidTarget;
    } else if (std::holds_alternative<CompleteTransaction>(event)) {
        if (isClean()) {
            throw std::logic_error("No transaction to complete");
        }
        next.lastValidTarget = incompleteTarget;
        next.incompleteTarget = "";
    } else if (std::holds_alternative<DeletedTransaction>(event)) {
        next.incompleteTarget = "";
    } else if (std::holds_alternative<RolledBackTransaction>(event)) {
        if (isClean()) {
            throw std::logic_error("No transaction to roll back");
        }
        next.lastValidTarget = incompleteTarget;
        next.incompleteTarget = "";
    } else if (const auto *adopted = std::get_if<AdoptTarget>(&event)) {
        if (!isClean()) {
            throw std::logic_error("Cannot adopt a target while " + incompleteTarget + " is incomplete");
        }
        next.lastValidTarget = adopted->target;
    }
    return next;
}

}  // namespace icestream
