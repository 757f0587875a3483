#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace zns {

// ---------------------------------------------------------------------------
// Resolver record set and its structured view
// ---------------------------------------------------------------------------
// A resolver stores a flat map of dotted keys:
//
//   crypto.ETH.address   -> 0x8aaD44321A86b170879d7A244c1e8d360c99DdA8
//   ipfs.html.value      -> QmVaAtQbi3EtsfpKoLzALm6vXphdi2KjMgxEDKeGg6wHuK
//
// structure() turns it into a tree keyed by segment:
//
//   { crypto: { ETH: { address: ... } }, ipfs: { html: { value: ... } } }
// ---------------------------------------------------------------------------

using RecordSet = std::map<std::string, std::string>;

class RecordNode;
using RecordTree = std::map<std::string, RecordNode>;

/// A tree node: either a string leaf or a sub-tree.
class RecordNode {
public:
    RecordNode() : value_(RecordTree{}) {}
    RecordNode(std::string leaf) : value_(std::move(leaf)) {}   // NOLINT
    RecordNode(const char* leaf) : value_(std::string(leaf)) {} // NOLINT
    RecordNode(RecordTree tree) : value_(std::move(tree)) {}    // NOLINT

    [[nodiscard]] bool is_leaf() const {
        return std::holds_alternative<std::string>(value_);
    }
    [[nodiscard]] bool is_tree() const {
        return std::holds_alternative<RecordTree>(value_);
    }

    [[nodiscard]] const std::string& leaf() const { return std::get<std::string>(value_); }
    [[nodiscard]] const RecordTree& tree() const { return std::get<RecordTree>(value_); }
    [[nodiscard]] RecordTree& tree() { return std::get<RecordTree>(value_); }

    bool operator==(const RecordNode& other) const { return value_ == other.value_; }
    bool operator!=(const RecordNode& other) const { return value_ != other.value_; }

private:
    std::variant<std::string, RecordTree> value_;
};

/// Builds the nested view of @p flat.
///
/// Keys are split on every '.', empty segments included. When a key and
/// a longer key sharing its path collide, the key processed last owns the
/// colliding segment; keys are processed in ascending order, so a deeper
/// key replaces a shorter scalar one. Each collision is logged at WARN.
[[nodiscard]] RecordTree structure(const RecordSet& flat);

/// Looks up a dotted path in @p tree. Returns nullptr if any segment is
/// missing or crosses a leaf.
[[nodiscard]] const RecordNode* find(const RecordTree& tree,
                                     std::string_view path);

/// Inverse of structure() for record sets without prefix collisions.
/// Empty sub-trees produce no keys.
[[nodiscard]] RecordSet flatten(const RecordTree& tree);

} // namespace zns
