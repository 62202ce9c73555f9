//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Scriptable stdio tool provider used by the process-level tests
//==========================================================================================================

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/WireCodec.h"

using namespace toolhost;

// Modes (--mode=NAME):
//   normal      answers initialize, tools/list and tools/call
//   silent      never answers initialize
//   init-error  answers initialize with a JSON-RPC error
//   crash       writes to stderr and exits with status 3 before the handshake
// Tools in normal mode:
//   ping   -> "pong"
//   echo   -> arguments.message
//   sleep  -> waits arguments.ms milliseconds, then "slept"
//   grow   -> adds tool "extra" and sends notifications/tools/list_changed
//   crash  -> exits with status 5 without answering
//   fail   -> result with isError=true

namespace {

bool gGrown = false;

void send(const Envelope& env) {
    std::cout << EncodeEnvelope(env);
    std::cout.flush();
}

JSONValue textResult(const std::string& text, bool isError = false) {
    JSONValue::Object item;
    SetMember(item, "type", JSONValue(std::string("text")));
    SetMember(item, "text", JSONValue(text));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object result;
    SetMember(result, "content", JSONValue(std::move(content)));
    if (isError) SetMember(result, "isError", JSONValue(true));
    return JSONValue(std::move(result));
}

JSONValue toolList() {
    JSONValue::Array tools;
    auto add = [&](const std::string& name, const std::string& description, JSONValue schema) {
        Tool t;
        t.name = name;
        t.description = description;
        t.inputSchema = std::move(schema);
        tools.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    };
    JSONValue::Object empty;
    SetMember(empty, "type", JSONValue(std::string("object")));
    add("ping", "Replies pong", JSONValue(empty));

    JSONValue::Object messageProp;
    SetMember(messageProp, "type", JSONValue(std::string("string")));
    JSONValue::Object props;
    SetMember(props, "message", JSONValue(std::move(messageProp)));
    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(std::string("message")));
    JSONValue::Object echoSchema;
    SetMember(echoSchema, "type", JSONValue(std::string("object")));
    SetMember(echoSchema, "properties", JSONValue(std::move(props)));
    SetMember(echoSchema, "required", JSONValue(std::move(required)));
    add("echo", "Echoes message", JSONValue(std::move(echoSchema)));

    add("sleep", "Sleeps for ms milliseconds", JSONValue(empty));
    add("grow", "Adds a tool", JSONValue(empty));
    add("crash", "Exits abnormally", JSONValue(empty));
    add("fail", "Returns an error result", JSONValue(empty));
    if (gGrown) add("extra", "Added at runtime", JSONValue(empty));

    JSONValue::Object result;
    SetMember(result, "tools", JSONValue(std::move(tools)));
    return JSONValue(std::move(result));
}

JSONValue errorObject(int64_t code, const std::string& message) {
    JSONValue::Object err;
    SetMember(err, "code", JSONValue(code));
    SetMember(err, "message", JSONValue(message));
    return JSONValue(std::move(err));
}

void handleCall(const JSONRPCId& id, const JSONValue& params) {
    const std::string name = GetStringMember(params, "name").value_or("");
    const JSONValue* args = params.find("arguments");
    if (name == "ping") {
        send(Envelope::Result(id, textResult("pong")));
    } else if (name == "echo") {
        send(Envelope::Result(id, textResult(args ? GetStringMember(*args, "message").value_or("") : "")));
    } else if (name == "sleep") {
        const double ms = args ? GetNumberMember(*args, "ms").value_or(0) : 0;
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int64_t>(ms)));
        send(Envelope::Result(id, textResult("slept")));
    } else if (name == "grow") {
        gGrown = true;
        send(Envelope::Result(id, textResult("grown")));
        send(Envelope::Notification(Methods::ToolListChanged));
    } else if (name == "crash") {
        std::cerr << "fake provider crashing" << std::endl;
        std::_Exit(5);
    } else if (name == "fail") {
        send(Envelope::Result(id, textResult("tool failed", true)));
    } else {
        send(Envelope::Error(id, errorObject(-32602, "Unknown tool: " + name)));
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string mode = "normal";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--mode=", 0) == 0) mode = a.substr(7);
    }

    // Providers commonly print a banner; the client must skip it.
    std::cout << "fake provider ready (" << mode << ")" << std::endl;

    if (mode == "crash") {
        std::cerr << "fatal: missing configuration" << std::endl;
        return 3;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        DecodeResult d = DecodeLine(line);
        if (d.outcome != DecodeOutcome::Envelope) continue;
        const Envelope& env = d.envelope;
        if (!env.method) continue;
        const std::string& method = *env.method;
        if (!env.id) {
            if (method == Methods::Shutdown) return 0;
            continue;
        }
        const JSONRPCId& id = *env.id;
        const JSONValue params = env.params.value_or(JSONValue(JSONValue::Object{}));
        if (method == Methods::Initialize) {
            if (mode == "silent") continue;
            if (mode == "init-error") {
                send(Envelope::Error(id, errorObject(-32603, "initialization refused")));
                continue;
            }
            JSONValue::Object info;
            SetMember(info, "name", JSONValue(std::string("fake-provider")));
            SetMember(info, "version", JSONValue(std::string("1.0.0")));
            JSONValue::Object caps;
            SetMember(caps, "tools", JSONValue(JSONValue::Object{}));
            JSONValue::Object result;
            SetMember(result, "protocolVersion", JSONValue(std::string("2024-11-05")));
            SetMember(result, "capabilities", JSONValue(std::move(caps)));
            SetMember(result, "serverInfo", JSONValue(std::move(info)));
            send(Envelope::Result(id, JSONValue(std::move(result))));
        } else if (method == Methods::ListTools) {
            send(Envelope::Result(id, toolList()));
        } else if (method == Methods::CallTool) {
            handleCall(id, params);
        } else {
            send(Envelope::Error(id, errorObject(-32601, "Method not found: " + method)));
        }
    }
    return 0;
}
