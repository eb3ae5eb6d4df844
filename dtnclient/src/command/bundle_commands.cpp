#include "command_base.hpp"
#include "command_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

namespace dtnclient::commands {

namespace {

constexpr const char* kDefaultLifetime = "24h";

Value json_to_value(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::json::value_t::number_unsigned:
            return Value(json.get<unsigned long long>());
        case nlohmann::json::value_t::number_integer:
            return Value(json.get<long long>());
        case nlohmann::json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::json::value_t::array: {
            Array array;
            for (const auto& element : json) {
                array.push_back(json_to_value(element));
            }
            return Value(std::move(array));
        }
        case nlohmann::json::value_t::object: {
            Mapping mapping;
            for (auto it = json.begin(); it != json.end(); ++it) {
                set(mapping, it.key(), json_to_value(it.value()));
            }
            return Value(std::move(mapping));
        }
        case nlohmann::json::value_t::binary: {
            const auto& binary = json.get_binary();
            return Value(Bytes(binary.begin(), binary.end()));
        }
        default:
            throw UsageError("unsupported JSON value in --args-json");
    }
}

Mapping parse_args_json(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& exc) {
        throw UsageError(std::string("--args-json is not valid JSON: ") + exc.what());
    }
    if (!json.is_object()) {
        throw UsageError("--args-json must be a JSON object");
    }
    return json_to_value(json).as_mapping();
}

Bytes read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw UsageError("cannot open payload file '" + path + "'");
    }
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string file_name_for(const std::string& bundle_id) {
    std::string name = bundle_id;
    for (char& c : name) {
        if (c == '/' || c == ':' || c == '\\') {
            c = '_';
        }
    }
    return name.empty() ? "bundle" : name;
}

// Writes the payload below directory and returns the file path.
std::filesystem::path save_payload(const std::filesystem::path& directory, const BundleContent& content) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw Error("cannot create output directory " + directory.string() + ": " + ec.message());
    }
    std::filesystem::path path = directory / file_name_for(content.bundle_id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.payload.data()), static_cast<std::streamsize>(content.payload.size()));
    out.close();
    if (!out) {
        throw Error("cannot write payload to " + path.string());
    }
    return path;
}

nlohmann::json bundle_to_json(const BundleContent& content) {
    nlohmann::json json;
    json["bundle_id"] = content.bundle_id;
    json["source"] = content.source.str();
    json["destination"] = content.destination.str();
    json["payload_size"] = content.payload.size();
    return json;
}

void print_bundle(CommandContext& ctx, const BundleContent& content, const std::optional<std::string>& output) {
    nlohmann::json json = bundle_to_json(content);
    if (output) {
        json["payload_file"] = save_payload(*output, content).string();
    }
    ctx.out << json.dump() << std::endl;
}

class CreateCommand final : public CommandHandler {
public:
    const char* name() const override { return "create"; }
    const char* usage() const override {
        return "create --destination <EID> [--source <EID>] [--report-to <EID>] [--lifetime <duration>] "
               "[--payload <text> | --payload-file <path>] [--args-json <object>]";
    }

    void run(CommandContext& ctx) override {
        require_positional(positional_args(ctx), 0);

        auto destination = option_value(ctx, "--destination");
        if (!destination) {
            throw UsageError("create requires --destination");
        }

        Mapping args;
        set(args, "destination", parse_eid_arg(*destination, "destination").str());
        if (auto source = option_value(ctx, "--source")) {
            set(args, "source", parse_eid_arg(*source, "source").str());
        }
        if (auto report_to = option_value(ctx, "--report-to")) {
            set(args, "report_to", parse_eid_arg(*report_to, "report-to").str());
        }
        set(args, "creation_timestamp_now", true);
        set(args, "lifetime", option_value(ctx, "--lifetime").value_or(kDefaultLifetime));

        auto payload = option_value(ctx, "--payload");
        auto payload_file = option_value(ctx, "--payload-file");
        if (payload && payload_file) {
            throw UsageError("--payload and --payload-file are mutually exclusive");
        }
        Bytes payload_bytes;
        if (payload) {
            payload_bytes.assign(payload->begin(), payload->end());
        } else if (payload_file) {
            payload_bytes = read_file(*payload_file);
        }
        set(args, "payload_block", std::move(payload_bytes));

        if (auto extra = option_value(ctx, "--args-json")) {
            for (auto& entry : parse_args_json(*extra)) {
                set(args, entry.first, std::move(entry.second));
            }
        }

        std::string bundle_id = ctx.client.create_bundle(args);
        LOG4CPLUS_INFO(client_logger(), "Created bundle " << bundle_id);
        ctx.out << bundle_id << std::endl;
    }

protected:
    bool takes_value(const std::string& option) const override {
        return option == "--destination" || option == "--source" || option == "--report-to" ||
               option == "--lifetime" || option == "--payload" || option == "--payload-file" ||
               option == "--args-json";
    }
};

class ListCommand final : public CommandHandler {
public:
    const char* name() const override { return "list"; }
    const char* usage() const override { return "list [--new] <mailbox EID>"; }

    void run(CommandContext& ctx) override {
        auto positional = positional_args(ctx);
        require_positional(positional, 1);
        Eid mailbox = parse_eid_arg(positional[0], "mailbox");

        for (const auto& bundle_id : ctx.client.list_bundles(mailbox, has_flag(ctx, "--new"))) {
            ctx.out << bundle_id << "\n";
        }
        ctx.out.flush();
    }
};

class FetchCommand final : public CommandHandler {
public:
    const char* name() const override { return "fetch"; }
    const char* usage() const override { return "fetch [--remove] [--output <dir>] <mailbox EID> <bundle-id>"; }

    void run(CommandContext& ctx) override {
        auto positional = positional_args(ctx);
        require_positional(positional, 2);
        Eid mailbox = parse_eid_arg(positional[0], "mailbox");

        BundleContent content = ctx.client.fetch_bundle(mailbox, positional[1], has_flag(ctx, "--remove"));
        print_bundle(ctx, content, option_value(ctx, "--output"));
    }

protected:
    bool takes_value(const std::string& option) const override { return option == "--output"; }
};

class FetchAllCommand final : public CommandHandler {
public:
    const char* name() const override { return "fetch-all"; }
    const char* usage() const override { return "fetch-all [--new] [--remove] [--output <dir>] <mailbox EID>"; }

    void run(CommandContext& ctx) override {
        auto positional = positional_args(ctx);
        require_positional(positional, 1);
        Eid mailbox = parse_eid_arg(positional[0], "mailbox");

        auto output = option_value(ctx, "--output");
        auto contents = ctx.client.fetch_all_bundles(mailbox, has_flag(ctx, "--new"), has_flag(ctx, "--remove"));
        LOG4CPLUS_INFO(client_logger(), "Fetched " << contents.size() << " bundles from " << mailbox);
        for (const auto& content : contents) {
            print_bundle(ctx, content, output);
        }
    }

protected:
    bool takes_value(const std::string& option) const override { return option == "--output"; }
};

} // namespace

void register_bundle_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<CreateCommand>());
    registry.add(std::make_unique<ListCommand>());
    registry.add(std::make_unique<FetchCommand>());
    registry.add(std::make_unique<FetchAllCommand>());
}

} // namespace dtnclient::commands
