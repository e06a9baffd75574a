//
// Copyright (C) 2024 Glauco Pacheco <glauco@kourier.io>
// SPDX-License-Identifier: AGPL-3.0-only
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as
// published by the Free Software Foundation, version 3 of the License.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//

#include <Http/HttpRequestParser.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFile>
#include <QtLogging>
#include <string_view>
#include <vector>

using Scanline::HttpHeader;
using Scanline::HttpParserOptions;
using Scanline::HttpRequest;
using Scanline::HttpRequestParser;
using Scanline::ParseStatus;


static void printRequest(const HttpRequest &request)
{
    if (request.method())
        qInfo("Method : %.*s", static_cast<int>(request.method()->size()), request.method()->data());
    if (request.path())
        qInfo("Path   : %.*s", static_cast<int>(request.path()->size()), request.path()->data());
    if (request.version())
        qInfo("Version: HTTP/1.%d", static_cast<int>(*request.version()));
    for (const auto &header : request.headers().headers())
    {
        qInfo("Header : %.*s: %.*s",
              static_cast<int>(header.name.size()), header.name.data(),
              static_cast<int>(header.value.size()), header.value.data());
    }
}

static int64_t optionValue(QCommandLineParser &cmdLineParser, const QString &name)
{
    bool conversionSucceeded = false;
    const int64_t value = cmdLineParser.value(name).toLongLong(&conversionSucceeded);
    if (!conversionSucceeded)
        cmdLineParser.showHelp(1);
    return value;
}

static void setParserOption(HttpParserOptions &options, HttpParserOptions::ParserOption option, int64_t value)
{
    if (!options.setOption(option, value))
        qFatal("Failed to set parser option. %s", options.errorMessage().data());
}


int main(int argc, char ** argv)
{
    QCoreApplication app(argc, argv);
    QCommandLineParser cmdLineParser;
    cmdLineParser.setApplicationDescription("Parses the request line and headers of an HTTP/1.x request read from <file> "
                                            "or from the standard input. Data is fed to the parser in chunks and the "
                                            "buffer is parsed again from its start after each chunk is appended.");
    cmdLineParser.addHelpOption();
    cmdLineParser.addPositionalArgument("file", "File containing the request. The standard input is read if no file is given.", "[file]");
    cmdLineParser.addOption({"chunk-size", "Appends <N> bytes to the parsing buffer before each parse attempt.", "N", "4096"});
    cmdLineParser.addOption({"max-headers", "Parses requests having at most <N> header lines.", "N", "64"});
    cmdLineParser.addOption({"max-uri-size", "Rejects request targets larger than <N> bytes. The default value of 0 disables the limit.", "N", "0"});
    cmdLineParser.addOption({"max-header-name-size", "Rejects header names larger than <N> bytes. The default value of 0 disables the limit.", "N", "0"});
    cmdLineParser.addOption({"max-header-value-size", "Rejects header values larger than <N> bytes. The default value of 0 disables the limit.", "N", "0"});
    cmdLineParser.addOption({"allow-multiple-spaces", "Accepts multiple spaces between the request line elements. This option does not accept any value."});
    cmdLineParser.addOption({"allow-spaces-after-header-name", "Accepts whitespace between header names and colons. This option does not accept any value."});
    cmdLineParser.addOption({"ignore-invalid-headers", "Skips invalid header lines instead of rejecting the request. This option does not accept any value."});
    cmdLineParser.process(app);
    const int64_t chunkSize = optionValue(cmdLineParser, "chunk-size");
    const int64_t maxHeaders = optionValue(cmdLineParser, "max-headers");
    if (chunkSize <= 0 || maxHeaders < 0)
        cmdLineParser.showHelp(1);
    HttpParserOptions options;
    setParserOption(options, HttpParserOptions::ParserOption::MaxUriSize, optionValue(cmdLineParser, "max-uri-size"));
    setParserOption(options, HttpParserOptions::ParserOption::MaxHeaderNameSize, optionValue(cmdLineParser, "max-header-name-size"));
    setParserOption(options, HttpParserOptions::ParserOption::MaxHeaderValueSize, optionValue(cmdLineParser, "max-header-value-size"));
    setParserOption(options, HttpParserOptions::ParserOption::AllowMultipleSpacesInRequestLineDelimiters, cmdLineParser.isSet("allow-multiple-spaces") ? 1 : 0);
    setParserOption(options, HttpParserOptions::ParserOption::AllowSpacesAfterHeaderName, cmdLineParser.isSet("allow-spaces-after-header-name") ? 1 : 0);
    setParserOption(options, HttpParserOptions::ParserOption::IgnoreInvalidHeaders, cmdLineParser.isSet("ignore-invalid-headers") ? 1 : 0);

    QFile inputFile;
    const auto positionalArguments = cmdLineParser.positionalArguments();
    if (positionalArguments.size() > 1)
        cmdLineParser.showHelp(1);
    else if (positionalArguments.size() == 1)
    {
        inputFile.setFileName(positionalArguments.first());
        if (!inputFile.open(QIODevice::ReadOnly))
            qFatal("Failed to open %s. %s", qUtf8Printable(inputFile.fileName()), qUtf8Printable(inputFile.errorString()));
    }
    else if (!inputFile.open(stdin, QIODevice::ReadOnly))
        qFatal("Failed to open the standard input. %s", qUtf8Printable(inputFile.errorString()));
    const QByteArray input = inputFile.readAll();

    const HttpRequestParser parser(options);
    std::vector<HttpHeader> headerStorage(static_cast<size_t>(maxHeaders));
    HttpRequest request(headerStorage);
    QByteArray buffer;
    buffer.reserve(input.size());
    auto parserStatus = ParseStatus<size_t>::partial();
    size_t parseAttempts = 0;
    for (qsizetype offset = 0; offset < input.size() && parserStatus.isPartial();)
    {
        const auto chunk = input.sliced(offset, qMin<qsizetype>(chunkSize, input.size() - offset));
        buffer.append(chunk);
        offset += chunk.size();
        parserStatus = parser.parse(std::string_view(buffer.constData(), buffer.size()), request);
        ++parseAttempts;
    }
    switch (parserStatus.state())
    {
        case ParseStatus<size_t>::State::Complete:
            printRequest(request);
            qInfo("Parsed %zu bytes of %lld after %zu attempts.", parserStatus.value(), static_cast<long long>(input.size()), parseAttempts);
            return 0;
        case ParseStatus<size_t>::State::Failed:
            printRequest(request);
            qWarning("Failed to parse request. %s", Scanline::errorMessage(parserStatus.error()).data());
            return 1;
        case ParseStatus<size_t>::State::Partial:
            printRequest(request);
            qWarning("Input ended before the header block was complete (%lld bytes read).", static_cast<long long>(input.size()));
            return 2;
    }
    Q_UNREACHABLE();
}
