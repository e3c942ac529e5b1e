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

#pragma once

#include <QSettings>
#include <QString>

namespace rwdump
{

struct DumpSettings
{
    int bytesPerLine = 16;
    int maxHexBytes = 256; // 0 shows the whole payload
    bool strictEnums = true;
};

// RWDUMP_CONFIG_INI if set, else rwdump.ini beside the executable.
QString RwDumpSettingsPath();

QSettings OpenRwDumpSettings(const QString &path = RwDumpSettingsPath());

// Hex view widths outside 1..64 are pulled back into range.
int ClampBytesPerLine(int value);

DumpSettings ReadDumpSettings(const QSettings &settings);
void WriteDumpSettings(QSettings &settings, const DumpSettings &values);

} // namespace rwdump
