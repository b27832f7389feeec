/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file rcsvConvert.cpp
 * @brief CLI tool to re-delimit, project and truncate delimited text files
 *
 * Reads INPUT as generic rows (column names from its header line) and writes them
 * to OUTPUT, or stdout when no OUTPUT is given.  Progress and errors go to stderr.
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <rcsv/rcsv.h>

struct Config {
    std::string input_file;
    std::string output_file;                 // empty: stdout
    std::string delimiter = ",";
    std::string out_delimiter;               // empty: same as input
    std::vector<std::string> columns;        // empty: all columns
    size_t batch_size = rcsv::DEFAULT_BATCH_SIZE;
    size_t head = std::numeric_limits<size_t>::max();
    bool include_header = true;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT [OUTPUT]\n\n";
    std::cout << "Convert a delimited text file: change the delimiter, select columns, limit rows.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  INPUT          Input file path (first line is the header)\n";
    std::cout << "  OUTPUT         Output file path (default: stdout)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --delimiter STR      Input delimiter (default: ',')\n";
    std::cout << "  -o, --out-delimiter STR  Output delimiter (default: input delimiter)\n";
    std::cout << "  -c, --columns A,B,C      Write only these columns, in this order\n";
    std::cout << "  -n, --head N             Write at most N rows\n";
    std::cout << "  -b, --batch-size N       Rows read per batch (default: " << rcsv::DEFAULT_BATCH_SIZE << ")\n";
    std::cout << "  --no-header              Don't write the header line\n";
    std::cout << "  -v, --verbose            Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -d ';' data.csv out.csv\n";
    std::cout << "  " << program_name << " -c time,value -n 100 data.csv\n";
    std::cout << "  " << program_name << " -o '\\t' data.csv | less\n";
}

/// "\t" on the command line means a tab
std::string unescapeDelimiter(std::string delim) {
    if (delim == "\\t") {
        return "\t";
    }
    return delim;
}

std::vector<std::string> splitList(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

size_t parseCount(const std::string& text, const char* what) {
    try {
        size_t pos = 0;
        long long num = std::stoll(text, &pos);
        if (pos != text.size() || num <= 0) {
            throw std::invalid_argument(text);
        }
        return static_cast<size_t>(num);
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid " << what << ": " << text << std::endl;
        exit(1);
    }
}

Config parseArgs(int argc, char* argv[]) {
    Config config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--no-header") {
            config.include_header = false;
        } else if ((arg == "-d" || arg == "--delimiter") && i + 1 < argc) {
            config.delimiter = unescapeDelimiter(argv[++i]);
        } else if ((arg == "-o" || arg == "--out-delimiter") && i + 1 < argc) {
            config.out_delimiter = unescapeDelimiter(argv[++i]);
        } else if ((arg == "-c" || arg == "--columns") && i + 1 < argc) {
            config.columns = splitList(argv[++i]);
            if (config.columns.empty()) {
                std::cerr << "Error: Column list is empty" << std::endl;
                exit(1);
            }
        } else if ((arg == "-n" || arg == "--head") && i + 1 < argc) {
            config.head = parseCount(argv[++i], "number of rows");
        } else if ((arg == "-b" || arg == "--batch-size") && i + 1 < argc) {
            config.batch_size = parseCount(argv[++i], "batch size");
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (config.help) {
        return config;
    }
    if (positional.empty()) {
        std::cerr << "Error: Input file is required" << std::endl;
        exit(1);
    }
    if (positional.size() > 2) {
        std::cerr << "Error: Too many arguments. Expected INPUT [OUTPUT]." << std::endl;
        exit(1);
    }
    config.input_file = positional[0];
    if (positional.size() == 2) {
        config.output_file = positional[1];
    }
    if (config.out_delimiter.empty()) {
        config.out_delimiter = config.delimiter;
    }
    return config;
}

/// Copy the selected columns of `row` into `out`, in selection order.
void projectRow(const rcsv::Row& row, const std::vector<std::string>& columns, rcsv::Row& out) {
    out.clear();
    for (const auto& name : columns) {
        const rcsv::Row::Value* value = row.find(name);
        out.set(name, value ? *value : rcsv::Row::Value{});
    }
}

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);

        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }

        if (!std::filesystem::exists(config.input_file)) {
            std::cerr << "Error: Input file does not exist: " << config.input_file << std::endl;
            return 1;
        }

        rcsv::CsvConfig readConfig;
        readConfig.columnDelimiter = config.delimiter;
        readConfig.batchSize = config.batch_size;

        rcsv::CsvConfig writeConfig;
        writeConfig.columnDelimiter = config.out_delimiter;
        writeConfig.includeHeader = config.include_header;

        if (config.verbose) {
            std::cerr << "Input: " << config.input_file << std::endl;
            std::cerr << "Output: " << (config.output_file.empty() ? "stdout" : config.output_file) << std::endl;
            std::cerr << "Delimiter: '" << config.delimiter << "' -> '" << config.out_delimiter << "'" << std::endl;
            std::cerr << "Batch size: " << config.batch_size << std::endl;
        }

        rcsv::RowReader reader(std::make_unique<rcsv::FileLineSource>(config.input_file),
                               rcsv::RowBuilder(), readConfig);

        const auto& header = reader.header();
        if (!reader.getErrorMsg().empty()) {
            std::cerr << reader.getErrorMsg() << std::endl;
        }
        if (config.verbose) {
            std::cerr << "Header contains " << header.size() << " columns" << std::endl;
        }
        for (const auto& name : config.columns) {
            bool found = false;
            for (const auto& column : header) {
                if (column == name) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                std::cerr << "Warning: Column '" << name << "' not in input, written empty" << std::endl;
            }
        }

        std::unique_ptr<rcsv::LineSink> sink;
        if (config.output_file.empty()) {
            sink = std::make_unique<rcsv::StreamLineSink>(std::cout);
        } else {
            sink = std::make_unique<rcsv::FileLineSink>(config.output_file);
        }
        rcsv::RowWriter writer(*sink, writeConfig);

        rcsv::Row projected;
        while (writer.rowCount() < config.head && reader.readNext()) {
            if (config.columns.empty()) {
                writer.write(reader.row());
            } else {
                projectRow(reader.row(), config.columns, projected);
                writer.write(projected);
            }
            if (config.verbose && writer.rowCount() % 100000 == 0) {
                std::cerr << "Processed " << writer.rowCount() << " rows..." << std::endl;
            }
        }
        writer.close();

        if (writer.rowCount() == 0) {
            std::cerr << "Warning: No data rows in input" << std::endl;
        }
        if (config.verbose) {
            std::cerr << "Successfully wrote " << writer.rowCount() << " rows" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
