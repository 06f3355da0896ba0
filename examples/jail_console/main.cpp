#include "Jail.h"
#include "common/JailConfig.h"
#include "common/Logger.h"
#include "node/NodeManager.h"
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

void printUsage(const char *program) {
    std::cerr << "Usage: " << program << " [options] <node-url> <cell-script.js> <path> [args-json]\n"
              << "\n"
              << "Options:\n"
              << "  --base <file>         Base script evaluated first in the cell\n"
              << "  --config <file>       Jail configuration (JSON)\n"
              << "  --node-config <file>  Node configuration (JSON); replaces <node-url>\n"
              << "  --id <cell-id>        Cell identifier (default: console)\n";
}

bool readFile(const std::string &path, std::string &out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char *argv[]) {
    std::string basePath;
    std::string configPath;
    std::string nodeConfigPath;
    std::string cellId = "console";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--base" || arg == "--config" || arg == "--node-config" || arg == "--id") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--base") {
                basePath = value;
            } else if (arg == "--config") {
                configPath = value;
            } else if (arg == "--node-config") {
                nodeConfigPath = value;
            } else {
                cellId = value;
            }
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    size_t required = nodeConfigPath.empty() ? 3 : 2;
    if (positional.size() < required) {
        printUsage(argv[0]);
        return 1;
    }

    JAIL::Logger::initialize();

    std::string error;
    JAIL::JailConfig jailConfig;
    if (!configPath.empty()) {
        auto loaded = JAIL::JailConfig::loadFromFile(configPath, &error);
        if (!loaded) {
            std::cerr << "Failed to load " << configPath << ": " << error << "\n";
            return 1;
        }
        jailConfig = *loaded;
    }

    JAIL::NodeConfig nodeConfig;
    size_t next = 0;
    if (!nodeConfigPath.empty()) {
        auto loaded = JAIL::NodeConfig::loadFromFile(nodeConfigPath, &error);
        if (!loaded) {
            std::cerr << "Failed to load " << nodeConfigPath << ": " << error << "\n";
            return 1;
        }
        nodeConfig = *loaded;
    } else {
        nodeConfig.url = positional[next++];
    }

    std::string cellScript;
    if (!readFile(positional[next], cellScript)) {
        std::cerr << "Cannot read " << positional[next] << "\n";
        return 1;
    }
    ++next;

    std::string baseScript;
    if (!basePath.empty() && !readFile(basePath, baseScript)) {
        std::cerr << "Cannot read " << basePath << "\n";
        return 1;
    }

    if (next >= positional.size()) {
        printUsage(argv[0]);
        return 1;
    }
    std::string path = positional[next++];
    std::string args = next < positional.size() ? positional[next] : "[]";

    auto nodes = std::make_shared<JAIL::NodeManager>();
    try {
        nodes->attach(nodeConfig);
    } catch (const std::exception &e) {
        std::cerr << "Cannot attach to " << nodeConfig.url << ": " << e.what() << "\n";
        return 1;
    }

    JAIL::Jail jail(jailConfig, nodes, baseScript);

    std::cout << "parse: " << jail.parse(cellId, cellScript) << "\n";
    std::cout << "call:  " << jail.call(cellId, path, args) << "\n";

    JAIL::Logger::flush();
    return 0;
}
