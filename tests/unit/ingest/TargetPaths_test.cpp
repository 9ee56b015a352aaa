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

#include "../../../src/ingest/TargetPaths.h"

#include "gtest/gtest.h"

using namespace icestream;

TEST(TargetPathsTest, TestSiblings) {
    std::string target = "/data/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b.zarr";
    ASSERT_EQ(TargetPaths::highResSibling(target),
              "/data/EK80/demo/inst-EK80-prj-demo-2024-03-01t00-00-00zl1b_high_res.zarr");
    ASSERT_EQ(TargetPaths::sideloadPath(target), "/data/EK80/demo/setup.zarr");
    ASSERT_EQ(TargetPaths::sideloadPath("name.zarr"), "setup.zarr");
    ASSERT_EQ(TargetPaths::highResSibling("plain"), "plain_high_res");
}

TEST(TargetPathsTest, TestResolve) {
    ASSERT_EQ(TargetPaths::resolve("/data", "EK80/demo/a.zarr"), "/data/EK80/demo/a.zarr");
    ASSERT_EQ(TargetPaths::resolve("/data", ""), "");
}

TEST(TargetPathsTest, TestIsAuxiliary) {
    ASSERT_TRUE(TargetPaths::isAuxiliary("/data/EK80/demo/setup.zarr"));
    ASSERT_TRUE(TargetPaths::isAuxiliary("/data/EK80/demo/a_high_res.zarr"));
    ASSERT_FALSE(TargetPaths::isAuxiliary("/data/EK80/demo/a.zarr"));
}

TEST(TargetPathsTest, TestRelativePointer) {
    ASSERT_EQ(TargetPaths::relativePointer("/tmp/work/", "/tmp/work/EK80/demo/a.zarr/"), "EK80/demo/a.zarr");
    ASSERT_EQ(TargetPaths::relativePointer("/tmp/work", "/elsewhere/b.zarr"), "b.zarr");
}

TEST(TargetPathsTest, TestCandidateTargets) {
    std::vector<std::string> keys = {
        "/data/EK80/demo/b-2024-03-02.zarr/refs/branch.main",
        "/data/EK80/demo/b-2024-03-02.zarr/snapshots/1.json",
        "/data/EK60/other/a-2024-03-01.zarr/refs/branch.main",
        "/data/EK60/other/a-2024-03-01.zarr/refs/branch.valid",
        "/data/EK80/demo/b-2024-03-02_high_res.zarr/refs/branch.main",
        "/data/EK80/demo/setup.zarr/refs/branch.main",
        "/elsewhere/c-2024-03-03.zarr/refs/branch.main",
    };
    std::vector<std::string> candidates = TargetPaths::candidateTargets("/data/", keys);
    ASSERT_EQ(candidates, (std::vector<std::string>{"EK60/other/a-2024-03-01.zarr", "EK80/demo/b-2024-03-02.zarr"}));
    ASSERT_TRUE(TargetPaths::candidateTargets("/data", {}).empty());
}
