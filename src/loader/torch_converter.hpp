/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "loader/chunk.hpp"
#include <ATen/core/ivalue.h>
#include <format>
#include <optional>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace mva::loader::internal {

    // Look up a string key in an unpickled dictionary
    inline std::optional<c10::IValue> find_entry(const c10::impl::GenericDict& dict, const std::string& key) {
        for (const auto& entry : dict) {
            if (entry.key().isString() && entry.key().toStringRef() == key) {
                return entry.value();
            }
        }
        return std::nullopt;
    }

    inline c10::impl::GenericDict expect_dict(const c10::IValue& value, const std::string& what) {
        if (!value.isGenericDict()) {
            throw ChunkFormatError(std::format("{}: expected a dictionary, got {}", what, value.tagKind()));
        }
        return value.toGenericDict();
    }

    inline torch::Tensor expect_tensor(const c10::IValue& value, const std::string& what) {
        if (!value.isTensor()) {
            throw ChunkFormatError(std::format("{}: expected a tensor, got {}", what, value.tagKind()));
        }
        return value.toTensor();
    }

    inline std::string expect_string(const c10::IValue& value, const std::string& what) {
        if (!value.isString()) {
            throw ChunkFormatError(std::format("{}: expected a string, got {}", what, value.tagKind()));
        }
        return value.toStringRef();
    }

    // Python lists and tuples both unpickle to sequences of IValues
    inline std::vector<c10::IValue> expect_sequence(const c10::IValue& value, const std::string& what) {
        if (value.isList()) {
            auto list = value.toListRef();
            return {list.begin(), list.end()};
        }
        if (value.isTuple()) {
            const auto& elements = value.toTupleRef().elements();
            return {elements.begin(), elements.end()};
        }
        throw ChunkFormatError(std::format("{}: expected a list, got {}", what, value.tagKind()));
    }

    inline std::vector<torch::Tensor> expect_tensor_list(const c10::IValue& value, const std::string& what) {
        // A stacked tensor is accepted as a list along its first dimension
        if (value.isTensor()) {
            auto stacked = value.toTensor();
            std::vector<torch::Tensor> out;
            out.reserve(stacked.size(0));
            for (int64_t i = 0; i < stacked.size(0); ++i) {
                out.push_back(stacked[i]);
            }
            return out;
        }

        std::vector<torch::Tensor> out;
        for (const auto& item : expect_sequence(value, what)) {
            out.push_back(expect_tensor(item, what));
        }
        return out;
    }

    inline c10::IValue require_entry(const c10::impl::GenericDict& dict, const std::string& key,
                                     const std::string& what) {
        auto entry = find_entry(dict, key);
        if (!entry) {
            throw ChunkFormatError(std::format("{}: missing '{}'", what, key));
        }
        return *entry;
    }

} // namespace mva::loader::internal
