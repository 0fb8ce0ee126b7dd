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
#ifndef KIOSKCTL_HANDOFF_CHANNEL_H
#define KIOSKCTL_HANDOFF_CHANNEL_H

#include <string>

namespace kioskctl {

// Passes the next target URL to the out-of-process browser restart loop.
// Single slot, last writer wins; nothing is read back.
class HandoffChannel {
public:
    virtual ~HandoffChannel() = default;

    // Throws std::runtime_error when the URL cannot be stored.
    virtual void publish(const std::string& url) = 0;

    virtual std::string describe() const = 0;
};

// Stores the URL as the full raw content of a file (truncate + write, no newline).
class FileHandoffChannel : public HandoffChannel {
public:
    explicit FileHandoffChannel(const std::string& path);

    void publish(const std::string& url) override;
    std::string describe() const override { return path_; }

private:
    std::string path_;
};

} // namespace kioskctl

#endif // KIOSKCTL_HANDOFF_CHANNEL_H
