// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/records.h"
#include "core/logging.h"

#include <vector>

namespace zns {

namespace {

std::vector<std::string_view> split_path(std::string_view key) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    for (;;) {
        size_t dot = key.find('.', start);
        if (dot == std::string_view::npos) {
            segments.push_back(key.substr(start));
            return segments;
        }
        segments.push_back(key.substr(start, dot - start));
        start = dot + 1;
    }
}

void flatten_into(const RecordTree& tree, const std::string& prefix,
                  RecordSet& out) {
    for (const auto& [segment, node] : tree) {
        std::string key = prefix.empty() ? segment : prefix + "." + segment;
        if (node.is_leaf()) {
            out[key] = node.leaf();
        } else {
            flatten_into(node.tree(), key, out);
        }
    }
}

} // anonymous namespace

RecordTree structure(const RecordSet& flat) {
    RecordTree root;

    for (const auto& [key, value] : flat) {
        auto segments = split_path(key);
        RecordTree* level = &root;

        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            RecordNode& child = (*level)[std::string(segments[i])];
            if (child.is_leaf()) {
                size_t end = static_cast<size_t>(segments[i].data() -
                                                 key.data()) +
                             segments[i].size();
                LOG_WARN(core::LogCategory::RECORDS,
                         "record key '" + key + "' replaces scalar value at '" +
                             key.substr(0, end) + "'");
                child = RecordTree{};
            }
            level = &child.tree();
        }

        RecordNode& slot = (*level)[std::string(segments.back())];
        if (slot.is_tree() && !slot.tree().empty()) {
            LOG_WARN(core::LogCategory::RECORDS,
                     "record key '" + key + "' replaces a nested record group");
        }
        slot = value;
    }
    return root;
}

const RecordNode* find(const RecordTree& tree, std::string_view path) {
    const RecordTree* level = &tree;
    const RecordNode* node = nullptr;

    for (std::string_view segment : split_path(path)) {
        if (!level) return nullptr;
        auto it = level->find(std::string(segment));
        if (it == level->end()) return nullptr;
        node = &it->second;
        level = node->is_tree() ? &node->tree() : nullptr;
    }
    return node;
}

RecordSet flatten(const RecordTree& tree) {
    RecordSet out;
    flatten_into(tree, "", out);
    return out;
}

} // namespace zns
