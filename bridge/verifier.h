// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "common.h"
#include "errors.h"

namespace xbridge::bridge
{
    // Folds the leaf with its sibling path into the batch root.
    // Throws MalformedProof if the path is empty or longer than nMaxPath.
    void ComputeRoot(Hash& root, const Hash& leaf, const Merkle::Path&, uint32_t nMaxPath);

    // Root and per-leaf paths of a batch, each path checked against ComputeRoot.
    // Throws MalformedProof if any leaf would get a path the verifier refuses, a lone leaf included.
    void BuildBatch(Hash& root, std::vector<Merkle::Path>& vPaths, const Merkle::Builder&, uint32_t nMaxPath);

    // Throws InvalidSignature if no key can be recovered, WrongSignature if it isn't the expected one
    void VerifySignature(const Hash& msg, const Signature&, uint8_t nRecoveryId, const PubKey& expected);

} // namespace xbridge::bridge
