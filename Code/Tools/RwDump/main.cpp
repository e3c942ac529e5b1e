/*
**  Command & Conquer Renegade(tm)
**  Copyright 2025 Electronic Arts Inc.
**
**  This program is free software: you can redistribute it and/or modify
**  it under the terms of the GNU General Public License as published by
**  the Free Software Foundation, either version 3 of the License, or
**  (at your option) any later version.
**
**  This program is distributed in the hope that it will be useful,
**  but WITHOUT ANY WARRANTY; without even the implied warranty of
**  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
**  GNU General Public License for more details.
**
**  You should have received a copy of the GNU General Public License
**  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QStringList>
#include <iostream>
#include <string>
#include "rwdump_core.h"
#include "rwdump_settings.h"

namespace
{

struct PrintOptions
{
    bool fields = false;
    bool hex = false;
    std::size_t bytesPerLine = 16;
    std::size_t maxHexBytes = 256;
};

void PrintIndented(const std::string &text, int depth)
{
    const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t end = text.find('\n', start);
        const std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        std::cout << indent << line << "\n";
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

void PrintChunk(const rwdump::Chunk &chunk, const PrintOptions &options, int depth)
{
    PrintIndented(rwdump::format_chunk_label(chunk), depth);

    if (options.fields) {
        for (const auto &field : rwdump::describe_chunk(chunk)) {
            if (field.type == "chunk") {
                continue;
            }
            PrintIndented("| " + field.name + " (" + field.type + "): " + field.value, depth + 1);
        }
    }

    if (options.hex && chunk.children.empty()) {
        PrintIndented(rwdump::build_hex_view(chunk, options.bytesPerLine, options.maxHexBytes), depth + 1);
    }

    for (const auto &child : chunk.children) {
        PrintChunk(*child, options, depth + 1);
    }
}

// Texture names live in the first String child of a Texture chunk; rasters
// carry theirs in the struct.
void PrintTextureNames(const rwdump::Chunk &chunk)
{
    if (chunk.id() == rwdump::RW_CHUNK_TEXTURE) {
        if (const auto *name = chunk.find_child(rwdump::RW_CHUNK_STRING)) {
            if (const auto *text = name->get<rwdump::Text>()) {
                std::cout << text->value << "\n";
            }
        }
    } else if (const auto *raster = chunk.get<rwdump::Raster>()) {
        std::cout << raster->name << "\n";
    }

    for (const auto &child : chunk.children) {
        PrintTextureNames(*child);
    }
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("rwdump"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Chunk tree dumper for RenderWare binary stream files"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption fieldsOpt(QStringList() << "f" << "fields", QStringLiteral("Print decoded fields for every chunk."));
    QCommandLineOption hexOpt(QStringList() << "x" << "hex", QStringLiteral("Print a hex view of every leaf chunk."));
    QCommandLineOption dumpTexturesOpt(QStringList() << "t" << "dump-textures", QStringLiteral("Dump texture names to stdout."));
    QCommandLineOption permissiveOpt(QStringLiteral("permissive"), QStringLiteral("Keep unknown enum values instead of failing."));
    QCommandLineOption bytesPerLineOpt(QStringLiteral("bytes-per-line"), QStringLiteral("Hex view width."), QStringLiteral("n"));
    QCommandLineOption configOpt(QStringLiteral("config"), QStringLiteral("Read settings from this INI file."), QStringLiteral("ini"));
    QCommandLineOption verboseOpt(QStringList() << "v" << "verbose", QStringLiteral("Enable decoder debug output."));
    parser.addOption(fieldsOpt);
    parser.addOption(hexOpt);
    parser.addOption(dumpTexturesOpt);
    parser.addOption(permissiveOpt);
    parser.addOption(bytesPerLineOpt);
    parser.addOption(configOpt);
    parser.addOption(verboseOpt);
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("DFF/TXD/BSP file(s) to dump."), QStringLiteral("file..."));

    parser.process(app);

    if (parser.isSet(verboseOpt)) {
        QLoggingCategory::setFilterRules(QStringLiteral("rwdump.*.debug=true"));
    }

    const QString configPath = parser.isSet(configOpt) ? parser.value(configOpt) : rwdump::RwDumpSettingsPath();
    const QSettings settings = rwdump::OpenRwDumpSettings(configPath);
    const rwdump::DumpSettings config = rwdump::ReadDumpSettings(settings);

    PrintOptions print;
    print.fields = parser.isSet(fieldsOpt);
    print.hex = parser.isSet(hexOpt);
    print.bytesPerLine = static_cast<std::size_t>(config.bytesPerLine);
    print.maxHexBytes = static_cast<std::size_t>(config.maxHexBytes);
    if (parser.isSet(bytesPerLineOpt)) {
        bool ok = false;
        const int value = parser.value(bytesPerLineOpt).toInt(&ok);
        if (!ok || value <= 0) {
            qWarning() << "Ignoring invalid --bytes-per-line:" << parser.value(bytesPerLineOpt);
        } else {
            print.bytesPerLine = static_cast<std::size_t>(rwdump::ClampBytesPerLine(value));
        }
    }

    rwdump::DecodeOptions decode;
    decode.strict_enums = config.strictEnums && !parser.isSet(permissiveOpt);

    const bool dumpTextures = parser.isSet(dumpTexturesOpt);
    const auto files = parser.positionalArguments();
    if (files.isEmpty()) {
        std::cerr << "No input file specified.\n";
        return 1;
    }

    int status = 0;
    for (const QString &path : files) {
        rwdump::ChunkFile file;
        if (!file.load(path.toStdString(), decode)) {
            std::cerr << "Failed to load file: " << path.toStdString() << ": " << file.last_error() << "\n";
            status = 1;
            continue;
        }

        if (files.size() > 1 && !dumpTextures) {
            std::cout << "== " << path.toStdString() << "\n";
        }

        for (const auto &root : file.roots()) {
            if (dumpTextures) {
                PrintTextureNames(*root);
            } else {
                PrintChunk(*root, print, 0);
            }
        }
    }

    return status;
}
