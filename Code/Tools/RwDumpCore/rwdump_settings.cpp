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

#include "rwdump_settings.h"

#include "rwdump_log.h"

#include <QCoreApplication>
#include <QDir>

#include <algorithm>

namespace rwdump
{
namespace
{

const QString kBytesPerLineKey = QStringLiteral("Dump/BytesPerLine");
const QString kMaxHexBytesKey = QStringLiteral("Dump/MaxHexBytes");
const QString kStrictEnumsKey = QStringLiteral("Decode/StrictEnums");

constexpr int kMinBytesPerLine = 1;
constexpr int kMaxBytesPerLine = 64;

} // namespace

QString RwDumpSettingsPath()
{
    const QString env_path = QString::fromLocal8Bit(qgetenv("RWDUMP_CONFIG_INI")).trimmed();
    if (!env_path.isEmpty()) {
        return env_path;
    }

    return QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("rwdump.ini"));
}

QSettings OpenRwDumpSettings(const QString &path)
{
    return QSettings(path, QSettings::IniFormat);
}

int ClampBytesPerLine(int value)
{
    return std::clamp(value, kMinBytesPerLine, kMaxBytesPerLine);
}

DumpSettings ReadDumpSettings(const QSettings &settings)
{
    const DumpSettings defaults;
    DumpSettings values;

    bool ok = false;
    const int bytesPerLine = settings.value(kBytesPerLineKey, defaults.bytesPerLine).toInt(&ok);
    if (ok) {
        values.bytesPerLine = ClampBytesPerLine(bytesPerLine);
    } else {
        qCWarning(lcRwDumpFile) << "Ignoring non-numeric" << kBytesPerLineKey << "in" << settings.fileName();
    }

    const int maxHexBytes = settings.value(kMaxHexBytesKey, defaults.maxHexBytes).toInt(&ok);
    if (ok && maxHexBytes >= 0) {
        values.maxHexBytes = maxHexBytes;
    } else {
        qCWarning(lcRwDumpFile) << "Ignoring invalid" << kMaxHexBytesKey << "in" << settings.fileName();
    }

    values.strictEnums = settings.value(kStrictEnumsKey, defaults.strictEnums).toBool();
    return values;
}

void WriteDumpSettings(QSettings &settings, const DumpSettings &values)
{
    settings.setValue(kBytesPerLineKey, values.bytesPerLine);
    settings.setValue(kMaxHexBytesKey, values.maxHexBytes);
    settings.setValue(kStrictEnumsKey, values.strictEnums);
}

} // namespace rwdump
