//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SettingsStore.h
// Purpose: Reads and writes the JSON settings document that holds the configured servers
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {

// Where the server map lives inside the settings document.
enum class SettingsLayout {
    Nested, // { "mcp": { "mcpServers": { ... } } }
    Bare    // { "mcpServers": { ... } }
};

//==========================================================================================================
// SettingsDocument
// Purpose: A loaded settings file.
// Fields:
//   root: The whole document; keys other than the server map are written back untouched.
//   layout: Form the server map was found in (Nested for a new file).
//   servers: Configured servers keyed by id.
//   skipped: One message per entry that could not be read.
//   unparsed: Raw JSON of those entries keyed by id; Save writes them back unless servers has the id.
//==========================================================================================================
struct SettingsDocument {
    JSONValue root{JSONValue::Object{}};
    SettingsLayout layout{SettingsLayout::Nested};
    std::map<std::string, ServerConfig> servers;
    std::vector<std::string> skipped;
    std::map<std::string, JSONValue> unparsed;
};

class SettingsStore {
public:
    explicit SettingsStore(std::string path);

    // TOOLHOST_SETTINGS_PATH, else $HOME/.toolhost/settings.json
    static std::string DefaultPath();

    const std::string& Path() const { return path; }

    //==========================================================================================================
    // Load
    // Purpose: Reads the document. A missing file yields an empty document. Entries that fail to parse
    //          are skipped and listed in SettingsDocument::skipped.
    // Throws:
    //   ToolHostError(ConfigLoadError) when the file cannot be read, is not valid JSON, or its root or
    //   server map is not an object.
    //==========================================================================================================
    SettingsDocument Load() const;

    //==========================================================================================================
    // Save
    // Purpose: Replaces the server map in doc.root (in doc.layout form) with doc.servers plus the
    //          untouched doc.unparsed entries and writes the document through a temporary file renamed over the original. Parent directories are
    //          created as needed.
    // Throws:
    //   ToolHostError(ConfigLoadError) when the file cannot be written.
    //==========================================================================================================
    void Save(const SettingsDocument& doc) const;

    // Copies the current file to "<path>.bak". Returns the backup path, or nullopt when there is no file
    // or the copy failed.
    std::optional<std::string> Backup() const;

private:
    std::string path;
};

} // namespace toolhost
