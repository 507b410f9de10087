#include "cloud/blob.hpp"
#include "cloud/blob_error.hpp"
#include "cloud/blob_manager.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace urlblob;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
const char* helpText =
    "urlblob_cli [-u urlType] command [ARGS]\n\n"
    "-u, --url-type: override the url type detection [s3, gcp, azure, generic]\n\n"
    "COMMANDS:\n"
    "get url [range] [--start N] [--end N] [-o file] [-l|--lines] [--no-stream]\n"
    "    range: 'start-end', 'start-' or '-end' (end is inclusive)\n"
    "put url [content] [-t contentType] [-l|--lines]\n"
    "    reads stdin if no content is given, the content type defaults to text/plain\n"
    "stat url [-j|--json]\n";
//---------------------------------------------------------------------------
/// A wrong invocation
struct InvocationError : runtime_error {
    using runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
uint64_t parseNumber(string_view value)
// Parse a byte position
{
    auto number = utils::parseUnsigned(value);
    if (!number)
        throw InvocationError("Invalid number: " + string(value));
    return *number;
}
//---------------------------------------------------------------------------
string escapeJson(string_view value)
// Escape a json string
{
    string result;
    for (auto c : value) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    snprintf(buffer, sizeof(buffer), "\\u%04x", c);
                    result += buffer;
                } else {
                    result += c;
                }
        }
    }
    return result;
}
//---------------------------------------------------------------------------
void writeText(const string& content)
// Print text, binary content is only reported
{
    if (utils::Utf8::validate(content))
        cerr << "Downloaded " << content.size() << " bytes of binary data (use -o to save to file)" << endl;
    else
        cout << content << flush;
}
//---------------------------------------------------------------------------
int get(cloud::Blob& blob, const vector<string>& args)
// Download a blob
{
    optional<string> rangeString, output;
    optional<uint64_t> start, end;
    bool lines = false, noStream = false;
    for (size_t i = 0; i < args.size(); i++) {
        auto& arg = args[i];
        auto next = [&]() -> const string& {
            if (i + 1 >= args.size())
                throw InvocationError("Missing value for " + arg);
            return args[++i];
        };
        if (arg == "--start") {
            start = parseNumber(next());
        } else if (arg == "--end") {
            end = parseNumber(next());
        } else if (arg == "-o" || arg == "--output") {
            output = next();
        } else if (arg == "-l" || arg == "--lines") {
            lines = true;
        } else if (arg == "--no-stream") {
            noStream = true;
        } else if (!rangeString && !arg.starts_with("--")) {
            rangeString = arg;
        } else {
            throw InvocationError("Unknown argument: " + arg);
        }
    }

    if (rangeString) {
        if (start || end)
            throw InvocationError("Cannot specify both --range and --start/--end");
        auto dash = rangeString->find('-');
        if (dash == string::npos) {
            start = parseNumber(*rangeString);
        } else {
            auto first = string_view(*rangeString).substr(0, dash);
            auto second = string_view(*rangeString).substr(dash + 1);
            if (!first.empty())
                start = parseNumber(first);
            if (!second.empty())
                end = parseNumber(second);
        }
    }
    cloud::RangeArgs range{nullopt, start, end};

    ofstream file;
    if (output) {
        file.open(*output, ios::binary);
        if (!file)
            throw runtime_error("Could not open " + *output);
    }

    if (noStream) {
        auto content = blob.get(range);
        if (output) {
            file << content;
            cerr << "Downloaded " << content.size() << " bytes to " << *output << endl;
        } else {
            writeText(content);
        }
    } else if (lines) {
        uint64_t lineCount = 0;
        ostream& out = output ? static_cast<ostream&>(file) : cout;
        blob.streamLines([&](string_view line) {
            out << line << '\n';
            lineCount++;
        },
                         range);
        if (output)
            cerr << "Downloaded " << lineCount << " lines to " << *output << endl;
    } else if (output) {
        uint64_t totalBytes = 0;
        blob.stream([&](string_view chunk) {
            file.write(chunk.data(), static_cast<streamsize>(chunk.size()));
            totalBytes += chunk.size();
        },
                    range);
        cerr << "Downloaded " << totalBytes << " bytes to " << *output << endl;
    } else {
        // Collect the chunks to check for text
        string content;
        blob.stream([&](string_view chunk) { content.append(chunk); }, range);
        writeText(content);
    }
    if (output && !file.flush())
        throw runtime_error("Could not write " + *output);
    return 0;
}
//---------------------------------------------------------------------------
int put(cloud::Blob& blob, const vector<string>& args)
// Upload a blob
{
    optional<string> content;
    string contentType = "text/plain";
    bool lines = false;
    for (size_t i = 0; i < args.size(); i++) {
        auto& arg = args[i];
        if (arg == "-t" || arg == "--content-type") {
            if (i + 1 >= args.size())
                throw InvocationError("Missing value for " + arg);
            contentType = args[++i];
        } else if (arg == "-l" || arg == "--lines") {
            lines = true;
        } else if (!content) {
            content = arg;
        } else {
            throw InvocationError("Unknown argument: " + arg);
        }
    }
    if (!content)
        content = string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());

    if (lines) {
        vector<string> contentLines;
        for (auto line : utils::splitLines(*content))
            contentLines.emplace_back(line);
        blob.putLines(contentLines, contentType);
        cerr << "Uploaded " << contentLines.size() << " lines to " << blob.getUrl() << endl;
    } else {
        blob.put(*content, contentType);
        cerr << "Uploaded content to " << blob.getUrl() << endl;
    }
    return 0;
}
//---------------------------------------------------------------------------
int stat(cloud::Blob& blob, const vector<string>& args)
// Print the blob statistics
{
    bool json = false;
    for (auto& arg : args) {
        if (arg == "-j" || arg == "--json")
            json = true;
        else
            throw InvocationError("Unknown argument: " + arg);
    }

    auto stats = blob.stat();
    auto size = stats.sizeOrNone();
    auto contentType = stats.contentTypeOrNone();
    auto lastModified = stats.lastModifiedOrNone();

    if (json) {
        vector<string> fields;
        if (size)
            fields.push_back("  \"size\": " + to_string(*size));
        if (contentType)
            fields.push_back("  \"content_type\": \"" + escapeJson(*contentType) + "\"");
        if (lastModified)
            fields.push_back("  \"last_modified\": \"" + escapeJson(*lastModified) + "\"");
        cout << "{";
        for (size_t i = 0; i < fields.size(); i++)
            cout << (i ? ",\n" : "\n") << fields[i];
        cout << (fields.empty() ? "}" : "\n}") << endl;
        return 0;
    }

    cout << "Property\tValue" << endl;
    if (size)
        cout << "size\t" << *size << " (" << utils::formatSize(*size) << ")" << endl;
    if (contentType)
        cout << "content_type\t" << *contentType << endl;
    if (lastModified)
        cout << "last_modified\t" << *lastModified << endl;
    return 0;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    optional<cloud::Provider::Type> urlType;
    vector<string> args;
    try {
        for (auto i = 1; i < argc; i++) {
            if (!strcmp(argv[i], "-u") || !strcmp(argv[i], "--url-type")) {
                if (i + 1 >= argc)
                    throw InvocationError("Missing value for " + string(argv[i]));
                urlType = cloud::Provider::parseType(argv[++i]);
            } else if (!strcmp(argv[i], "-h") || !strcmp(argv[i], "--help")) {
                cout << helpText;
                return 0;
            } else {
                args.emplace_back(argv[i]);
            }
        }
    } catch (const exception& e) {
        cerr << e.what() << endl
             << endl
             << helpText;
        return 1;
    }

    if (args.size() < 2) {
        cerr << helpText;
        return 1;
    }

    auto command = args[0];
    vector<string> rest(args.begin() + 2, args.end());

    try {
        cloud::BlobManager manager;
        auto blob = manager.fromUrl(args[1], urlType);
        if (command == "get")
            return get(blob, rest);
        if (command == "put")
            return put(blob, rest);
        if (command == "stat")
            return stat(blob, rest);
        cerr << "Unknown command: " << command << endl
             << endl
             << helpText;
        return 1;
    } catch (const InvocationError& e) {
        cerr << e.what() << endl
             << endl
             << helpText;
        return 1;
    } catch (const cloud::BlobError& e) {
        cerr << "Error: " << cloud::BlobError::getKindName(e.getKind()) << " (" << e.getStatusCode() << "): " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}
//---------------------------------------------------------------------------
