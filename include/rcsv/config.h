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
 * @file config.h
 * @brief CsvConfig — options shared by the reader and writer engines.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

#include "definitions.h"

namespace rcsv {

    struct CsvConfig {
        std::string columnDelimiter     = DEFAULT_DELIMITER;        // separator for splitting and joining cells
        bool        includeHeader       = true;                     // writer emits a header line
        bool        useLowerCaseHeaders = false;                    // lower-case resolved column names (both directions)
        size_t      batchSize           = DEFAULT_BATCH_SIZE;       // max records buffered per read pass
        size_t      initialCapacity     = DEFAULT_INITIAL_CAPACITY; // reserve() hint for whole-collection reads
        bool        logErrors           = false;                    // true: conversion errors abort the read

        /// Throws std::invalid_argument if the configuration cannot drive a reader or writer.
        void validate() const {
            if (columnDelimiter.empty()) {
                throw std::invalid_argument("Error: Column delimiter cannot be empty");
            }
            if (batchSize == 0) {
                throw std::invalid_argument("Error: Batch size must be at least 1");
            }
        }
    };

} // namespace rcsv
