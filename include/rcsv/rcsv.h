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
 * @file rcsv.h
 * @brief Record CSV (RCSV) Library - Main Header
 *
 * A C++20 header-only library converting delimited text into typed records or generic
 * rows and back, with whole-collection and lazy batched access, blocking and async.
 *
 * This header includes all RCSV components:
 * - CsvConfig: parser/writer options
 * - RecordDescriptor / RecordTraits: field description of record types
 * - HeaderResolver: per-type cache of resolved column names
 * - Row: generic ordered row of optional string values
 * - LineSource / LineSink: line-oriented input and output
 * - BatchReader / AsyncBatchReader: batched reader engine
 * - RecordWriter / RowWriter: writer engine
 * - CsvParser: entry points tying it all together
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"
#include "config.h"

// Component declarations
#include "column_mapping.h"
#include "column_index.h"
#include "field_coercion.h"
#include "record_descriptor.h"
#include "record_concept.h"
#include "header_resolver.h"
#include "row.h"
#include "line_source.h"
#include "line_sink.h"
#include "line_splitter.h"
#include "record_builder.h"
#include "batch_reader.h"
#include "async_batch_reader.h"
#include "reader_concept.h"
#include "csv_writer.h"
#include "writer_concept.h"
#include "csv_parser.h"

// Include implementations
#include "column_index.hpp"
#include "field_coercion.hpp"
#include "record_descriptor.hpp"
#include "header_resolver.hpp"
#include "row.hpp"
#include "line_source.hpp"
#include "line_sink.hpp"
#include "record_builder.hpp"
#include "batch_reader.hpp"
#include "async_batch_reader.hpp"
#include "csv_writer.hpp"
#include "csv_parser.hpp"
