/*
 * Copyright 2025 Portico Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <ankerl/unordered_dense.h>

namespace portico::core {

// Container aliases backed by ankerl::unordered_dense.
//
// Key characteristics:
// - Dense storage: contiguous key-value pairs, iteration in insertion order
// - Iterator invalidation: like std::vector (insertion and erase both invalidate)
//
// Usage:
//   portico::core::fast_map<std::string, std::shared_ptr<Host>> items;
//   portico::core::fast_set<std::string> hostnames;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace portico::core
