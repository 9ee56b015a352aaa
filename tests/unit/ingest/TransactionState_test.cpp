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

#include "../../../src/ingest/TransactionState.h"

#include <stdexcept>

#include "gtest/gtest.h"

using namespace icestream;

static TransactionState stateOf(const std::string &last, const std::string &penultimate,
                                const std::string &incomplete) {
    TransactionState state;
    state.lastValidTarget = last;
    state.penultimateValidTarget = penultimate;
    state.incompleteTarget = incomplete;
    return state;
}

TEST(TransactionStateTest, TestNewThenComplete) {
    TransactionState state = stateOf("a.zarr", "", "");
    TransactionState started = state.apply(NewTransaction{"b.zarr"});
    ASSERT_EQ(started, stateOf("a.zarr", "a.zarr", "b.zarr"));
    ASSERT_FALSE(started.isClean());

    TransactionState completed = started.apply(CompleteTransaction{});
    ASSERT_EQ(completed, stateOf("b.zarr", "a.zarr", ""));
    ASSERT_TRUE(completed.isClean());
}

TEST(TransactionStateTest, TestAppendThenComplete) {
    TransactionState state = stateOf("b.zarr", "a.zarr", "");
    TransactionState appending = state.apply(AppendTransaction{});
    ASSERT_EQ(appending, stateOf("a.zarr", "a.zarr", "b.zarr"));

    ASSERT_EQ(appending.apply(CompleteTransaction{}), stateOf("b.zarr", "a.zarr", ""));
}

TEST(TransactionStateTest, TestRecoveryEvents) {
    TransactionState appending = stateOf("a.zarr", "a.zarr", "b.zarr");
    ASSERT_EQ(appending.apply(RolledBackTransaction{}), stateOf("b.zarr", "a.zarr", ""));
    ASSERT_EQ(appending.apply(DeletedTransaction{}), stateOf("a.zarr", "a.zarr", ""));

    TransactionState clean = stateOf("a.zarr", "", "");
    ASSERT_EQ(clean.apply(DeletedTransaction{}), clean);
}

TEST(TransactionStateTest, TestAdoptTarget) {
    TransactionState state = stateOf("gone.zarr", "older.zarr", "");
    ASSERT_EQ(state.apply(AdoptTarget{"found.zarr"}), stateOf("found.zarr", "older.zarr", ""));
    ASSERT_EQ(state.apply(AdoptTarget{""}), stateOf("", "older.zarr", ""));
}

TEST(TransactionStateTest, TestRejectedTransitions) {
    TransactionState busy = stateOf("a.zarr", "", "b.zarr");
    ASSERT_THROW(busy.apply(NewTransaction{"c.zarr"}), std::logic_error);
    ASSERT_THROW(busy.apply(AppendTransaction{}), std::logic_error);
    ASSERT_THROW(busy.apply(AdoptTarget{"c.zarr"}), std::logic_error);

    TransactionState clean = stateOf("", "", "");
    ASSERT_THROW(clean.apply(AppendTransaction{}), std::logic_error);
    ASSERT_THROW(clean.apply(CompleteTransaction{}), std::logic_error);
    ASSERT_THROW(clean.apply(RolledBackTransaction{}), std::logic_error);
    ASSERT_THROW(clean.apply(NewTransaction{""}), std::logic_error);
}

TEST(TransactionStateTest, TestEventNames) {
    ASSERT_EQ(transactionEventName(NewTransaction{"x"}), "new");
    ASSERT_EQ(transactionEventName(RolledBackTransaction{}), "rolled-back");
    ASSERT_EQ(transactionEventName(AdoptTarget{"x"}), "adopt");
}
