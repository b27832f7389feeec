/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_batch_reader.cpp
 * @brief Micro-benchmarks for the RCSV readers and writers using Google Benchmark
 *
 * Measures:
 * - Typed record read throughput per batch size (in-memory source)
 * - Generic row read throughput per batch size
 * - Async reader throughput per batch size
 * - Typed record write throughput
 * - File round trip (write + read back)
 *
 * Usage:
 *   bench_batch_reader [Google Benchmark flags]
 *   bench_batch_reader --benchmark_format=json --benchmark_out=results.json
 */

#include <benchmark/benchmark.h>
#include <rcsv/rcsv.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Measurement {
    double      timestamp = 0.0;
    float       temperature = 0.0f;
    std::string status;
    uint16_t    flags = 0;
    int32_t     counter = 0;
};

} // namespace

template<> struct rcsv::RecordTraits<Measurement> {
    static rcsv::RecordDescriptor<Measurement> describe() {
        return rcsv::RecordDescriptor<Measurement>()
            .field("timestamp", &Measurement::timestamp)
            .field("temperature", &Measurement::temperature)
            .field("status", &Measurement::status)
            .field("flags", &Measurement::flags)
            .field("counter", &Measurement::counter);
    }
};

// ============================================================================
// Dataset generation
// ============================================================================

namespace {

std::vector<Measurement> makeRecords(size_t rows) {
    std::vector<Measurement> records(rows);
    for (size_t i = 0; i < rows; ++i) {
        records[i].timestamp = static_cast<double>(i) * 0.001;
        records[i].temperature = 20.0f + 10.0f * std::sin(static_cast<float>(i) * 0.01f);
        records[i].status = (i % 10 == 0) ? "alarm" : "ok";
        records[i].flags = static_cast<uint16_t>(i & 0xFF);
        records[i].counter = static_cast<int32_t>(i);
    }
    return records;
}

const std::string& csvText(size_t rows) {
    static size_t cached_rows = 0;
    static std::string cached;
    if (cached_rows != rows) {
        rcsv::CsvParser parser;
        cached = parser.parseToString(makeRecords(rows));
        cached_rows = rows;
    }
    return cached;
}

rcsv::CsvConfig batchConfig(size_t batchSize) {
    rcsv::CsvConfig config;
    config.batchSize = batchSize;
    return config;
}

} // namespace

// ============================================================================
// BM_ReadRecords — typed records, batch size varied
// ============================================================================

static void BM_ReadRecords(benchmark::State& state) {
    const size_t N = 100000;
    const size_t batchSize = static_cast<size_t>(state.range(0));
    const std::string& text = csvText(N);
    rcsv::HeaderResolver resolver;

    for (auto _ : state) {
        rcsv::RecordReader<Measurement> reader(std::make_unique<rcsv::StringLineSource>(text),
            rcsv::RecordBuilder<Measurement>(resolver.resolve<Measurement>(), false), batchConfig(batchSize));
        int64_t sum = 0;
        while (reader.readNext()) {
            sum += reader.record().counter;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ReadRecords)->Arg(1)->Arg(64)->Arg(1024)->Arg(8192)->Arg(65536);

// ============================================================================
// BM_ReadRows — generic rows, batch size varied
// ============================================================================

static void BM_ReadRows(benchmark::State& state) {
    const size_t N = 100000;
    const size_t batchSize = static_cast<size_t>(state.range(0));
    const std::string& text = csvText(N);

    for (auto _ : state) {
        rcsv::RowReader reader(std::make_unique<rcsv::StringLineSource>(text), rcsv::RowBuilder(), batchConfig(batchSize));
        size_t count = 0;
        while (reader.fetchBatch() > 0) {
            count += reader.batch().size();
        }
        benchmark::DoNotOptimize(count);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_ReadRows)->Arg(64)->Arg(1024)->Arg(8192);

// ============================================================================
// BM_ReadRecordsAsync — AsyncBatchReader over an adapted in-memory source
// ============================================================================

static void BM_ReadRecordsAsync(benchmark::State& state) {
    const size_t N = 100000;
    const size_t batchSize = static_cast<size_t>(state.range(0));
    const std::string& text = csvText(N);
    rcsv::HeaderResolver resolver;

    for (auto _ : state) {
        rcsv::AsyncRecordReader<Measurement> reader(
            std::make_unique<rcsv::AsyncLineSourceAdapter>(std::make_unique<rcsv::StringLineSource>(text)),
            rcsv::RecordBuilder<Measurement>(resolver.resolve<Measurement>(), false), batchConfig(batchSize));
        std::vector<Measurement> all = reader.readAllAsync({}, N).get();
        benchmark::DoNotOptimize(all.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_ReadRecordsAsync)->Arg(64)->Arg(1024)->Arg(8192);

// ============================================================================
// BM_WriteRecords — typed records to an in-memory sink
// ============================================================================

static void BM_WriteRecords(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    std::vector<Measurement> records = makeRecords(N);
    rcsv::HeaderResolver resolver;

    for (auto _ : state) {
        rcsv::StringLineSink sink;
        rcsv::RecordWriter<Measurement> writer(sink, resolver.resolve<Measurement>());
        writer.writeAll(records);
        writer.close();
        benchmark::DoNotOptimize(sink.str().data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_WriteRecords)->Arg(1000)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_FileRoundTrip — parseToFile + toVector through the facade
// ============================================================================

static void BM_FileRoundTrip(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    std::vector<Measurement> records = makeRecords(N);
    const fs::path dir = fs::temp_directory_path() / "rcsv_bench_round_trip";
    fs::create_directories(dir);
    const fs::path path = dir / "bench.csv";
    rcsv::CsvParser parser;

    for (auto _ : state) {
        parser.parseToFile(path, records);
        std::vector<Measurement> back = parser.toVector<Measurement>(path);
        benchmark::DoNotOptimize(back.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    fs::remove_all(dir);
}
BENCHMARK(BM_FileRoundTrip)->Arg(10000)->Arg(100000);

BENCHMARK_MAIN();
