/*
 * Copyright (C) 2026 Codyard
 *
 * This file is part of KioskControl.
 *
 * KioskControl is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * KioskControl is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with KioskControl. If not, see <https://www.gnu.org/licenses/\>.
 */
#include "services/handoff_channel.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace kioskctl {

FileHandoffChannel::FileHandoffChannel(const std::string& path)
    : path_(path) {
}

void FileHandoffChannel::publish(const std::string& url) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open handoff file " + path_ + ": " + std::strerror(errno));
    }
    out.write(url.data(), static_cast<std::streamsize>(url.size()));
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Cannot write handoff file " + path_);
    }
}

} // namespace kioskctl
