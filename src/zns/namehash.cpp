// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/namehash.h"
#include "crypto/sha256.h"

namespace zns {

std::vector<std::string_view> split_labels(std::string_view domain) {
    std::vector<std::string_view> labels;
    size_t start = 0;
    while (start <= domain.size()) {
        size_t dot = domain.find('.', start);
        if (dot == std::string_view::npos) dot = domain.size();
        if (dot > start) labels.push_back(domain.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

Node childhash(const Node& parent, std::string_view label) {
    core::Hash256 label_hash = crypto::sha256(label);
    crypto::Sha256Hasher hasher;
    hasher.write(parent.span());
    hasher.write(label_hash.span());
    return hasher.finalize();
}

Node namehash(std::string_view domain) {
    auto labels = split_labels(domain);
    Node node = ROOT_NODE;
    for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
        node = childhash(node, *it);
    }
    return node;
}

std::string namehash_hex(std::string_view domain) {
    return namehash(domain).to_hex_prefixed();
}

core::Result<std::string> childhash_hex(std::string_view parent_hex,
                                        std::string_view label) {
    auto parent = Node::from_hex(parent_hex);
    if (!parent) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "parent node is not 32 bytes of hex: " +
                               std::string(parent_hex));
    }
    return childhash(*parent, label).to_hex_prefixed();
}

} // namespace zns
