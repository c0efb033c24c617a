// SPDX-FileCopyrightText:  2021-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FILESYSTEM_H
#define FATIMG_FILESYSTEM_H

#include <filesystem>
namespace std_fs {
using namespace std::filesystem;
}

#endif
