// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <blocksmith/core/common/hex.hpp>
#include <blocksmith/core/types/block.hpp>
#include <blocksmith/execution/local_block.hpp>
#include <blocksmith/infra/cli/common.hpp>
#include <blocksmith/infra/common/decoding_exception.hpp>
#include <blocksmith/infra/common/ensure.hpp>
#include <blocksmith/infra/common/log.hpp>
#include <blocksmith/rpc/json/types.hpp>

using namespace blocksmith;
using namespace blocksmith::cmd::common;

struct Settings {
    std::string input_file;
    bool print_rlp{false};
    bool print_json{false};
    log::Settings log_settings;
};

Settings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Assemble a locally mined block out of the results of executing its transactions"};

    Settings settings;
    try {
        cli.add_option("--input", settings.input_file, "Path to the JSON description of the block content")
            ->required()
            ->check(CLI::ExistingFile);
        cli.add_flag("--rlp", settings.print_rlp, "Prints the block RLP as hex string");
        cli.add_flag("--json", settings.print_json, "Prints the block with its receipts as JSON");

        add_logging_options(cli, settings.log_settings);

        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }

    return settings;
}

Transaction decode_transaction(const nlohmann::json& json) {
    const Bytes encoded{rpc::bytes_from_json(json)};
    ByteView view{encoded};
    Transaction txn;
    success_or_throw(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kBoth),
                     "invalid transaction RLP " + json.dump());
    return txn;
}

BlockHeader decode_ommer(const nlohmann::json& json) {
    const Bytes encoded{rpc::bytes_from_json(json)};
    ByteView view{encoded};
    BlockHeader ommer;
    success_or_throw(rlp::decode(view, ommer), "invalid ommer RLP " + json.dump());
    return ommer;
}

execution::LocalBlock assemble_block(const nlohmann::json& input) {
    ensure(input.is_object(), "Invalid input: block description must be a JSON object");

    auto partial_header{input.at("header").get<PartialHeader>()};

    std::vector<Transaction> transactions;
    for (const auto& txn_json : input.value("transactions", nlohmann::json::array())) {
        transactions.push_back(decode_transaction(txn_json));
    }
    auto callers{input.value("callers", std::vector<evmc::address>{})};
    auto receipts{input.value("receipts", std::vector<TransactionReceipt>{})};

    // Receipts may omit what can be derived from the transaction they belong to
    for (size_t i{0}; i < receipts.size() && i < transactions.size(); ++i) {
        if (!receipts[i].transaction_hash) {
            receipts[i].transaction_hash = transactions[i].hash();
        }
        if (!receipts[i].to && !receipts[i].contract_address) {
            receipts[i].to = transactions[i].to;
        }
    }

    std::vector<BlockHeader> ommers;
    for (const auto& ommer_json : input.value("ommers", nlohmann::json::array())) {
        ommers.push_back(decode_ommer(ommer_json));
    }

    std::optional<std::vector<Withdrawal>> withdrawals;
    if (input.contains("withdrawals") && !input.at("withdrawals").is_null()) {
        withdrawals = input.at("withdrawals").get<std::vector<Withdrawal>>();
    }

    BLOCKSMITH_INFO_M("Assembling block", {"number", std::to_string(partial_header.number),
                                           "txs", std::to_string(transactions.size()),
                                           "ommers", std::to_string(ommers.size())});
    return execution::LocalBlock{std::move(partial_header), std::move(transactions), std::move(callers),
                                 std::move(receipts), std::move(ommers), std::move(withdrawals)};
}

int main(int argc, char* argv[]) {
    try {
        Settings settings{parse_cli_settings(argc, argv)};
        log::init(settings.log_settings);

        std::ifstream input_stream{settings.input_file};
        ensure(input_stream.good(), [&]() { return "cannot open input file " + settings.input_file; });
        const auto input{nlohmann::json::parse(input_stream)};

        const execution::LocalBlock block{assemble_block(input)};
        BLOCKSMITH_INFO_M("Block assembled", {"number", std::to_string(block.header().number),
                                              "hash", to_hex(block.hash(), /*with_prefix=*/true),
                                              "size", std::to_string(block.wire_size())});

        std::cout << to_hex(block.hash(), /*with_prefix=*/true) << "\n";
        if (settings.print_rlp) {
            Bytes encoded;
            rlp::encode(encoded, block);
            std::cout << to_hex(encoded, /*with_prefix=*/true) << "\n";
        }
        if (settings.print_json) {
            nlohmann::json json = block;
            json["receipts"] = block.transaction_receipts();
            std::cout << json.dump(2) << "\n";
        }
        return 0;
    } catch (const CLI::ParseError&) {
        return -1;
    } catch (const DecodingException& de) {
        BLOCKSMITH_CRIT << "Invalid block content: " << de.what();
        return -2;
    } catch (const std::exception& e) {
        BLOCKSMITH_CRIT << "Block assembly failed: " << e.what();
        return -3;
    }
}
