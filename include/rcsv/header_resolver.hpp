/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file header_resolver.hpp
 * @brief HeaderResolver template implementations.
 */

#include "header_resolver.h"
#include "record_descriptor.hpp"
#include <mutex>
#include <typeinfo>

namespace rcsv {

    template<RecordConcept T>
    ResolvedHeaderPtr<T> HeaderResolver::compute() const {
        RecordDescriptor<T> descriptor = RecordTraits<T>::describe();

        std::vector<FieldDescriptor<T>> fields = descriptor.fields();
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto& field : fields) {
            names.push_back(field.columnName(lower_case_));
        }
        return std::make_shared<const ResolvedHeader<T>>(std::move(fields), std::move(names));
    }

    template<RecordConcept T>
    ResolvedHeaderPtr<T> HeaderResolver::resolve() {
        const std::type_index key(typeid(T));
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(key);
            if (it != cache_.end()) {
                return std::static_pointer_cast<const ResolvedHeader<T>>(it->second);
            }
        }

        // Computed outside the lock, describe() is user code
        ResolvedHeaderPtr<T> entry = compute<T>();

        std::unique_lock lock(mutex_);
        auto it = cache_.try_emplace(key, std::move(entry)).first;
        return std::static_pointer_cast<const ResolvedHeader<T>>(it->second);
    }

    template<RecordConcept T>
    bool HeaderResolver::isCached() const {
        std::shared_lock lock(mutex_);
        return cache_.find(std::type_index(typeid(T))) != cache_.end();
    }

    inline size_t HeaderResolver::cachedTypeCount() const {
        std::shared_lock lock(mutex_);
        return cache_.size();
    }

    inline void HeaderResolver::clearCaches() {
        std::unique_lock lock(mutex_);
        cache_.clear();
    }

} // namespace rcsv
