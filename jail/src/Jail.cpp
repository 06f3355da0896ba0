// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-JAIL-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of Jail (sandboxed JavaScript cells for RPC clients).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE in the project root

#include "Jail.h"
#include "common/JailError.h"
#include "common/Logger.h"
#include "common/ResultEnvelope.h"

namespace JAIL {

std::unique_ptr<Jail> Jail::instance_;
std::mutex Jail::instanceMutex_;

Jail::Jail(JailConfig config, std::shared_ptr<INodeManager> nodeManager, std::string baseScript)
    : config_(std::move(config)), bridge_(*this), baseScript_(std::move(baseScript)),
      nodeManager_(std::move(nodeManager)) {
    if (config_.logLevel) {
        Logger::setLevel(*config_.logLevel);
    }
    LOG_DEBUG("Jail: Created (gate timeout {}ms, bridge '{}')", config_.gateTimeout.count(), config_.bridgeName);
}

Jail::~Jail() {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    // Cells handed out through getVM() may outlive the registry; cut them off from its bridge
    for (auto &[id, cell] : cells_) {
        cell->setBridge(nullptr);
    }
    for (auto &weak : replaced_) {
        if (auto cell = weak.lock()) {
            cell->setBridge(nullptr);
        }
    }
    cells_.clear();
    replaced_.clear();
}

Jail &Jail::initialize(const std::string &baseScript) {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    if (!instance_) {
        instance_ = std::make_unique<Jail>(JailConfig{}, nullptr);
    }
    instance_->setBaseScript(baseScript);
    LOG_INFO("Jail: Initialized with {} bytes of base script", baseScript.size());
    return *instance_;
}

Jail &Jail::getInstance() {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    if (!instance_) {
        instance_ = std::make_unique<Jail>(JailConfig{}, nullptr);
    }
    return *instance_;
}

void Jail::reset() {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    instance_.reset();
}

bool Jail::isInitialized() {
    std::lock_guard<std::mutex> lock(instanceMutex_);
    return instance_ != nullptr;
}

std::string Jail::parse(const std::string &id, const std::string &script) {
    std::shared_ptr<ScriptingCell> cell;
    try {
        cell = std::make_shared<ScriptingCell>(id, config_.gateTimeout, config_.memoryLimitBytes);
    } catch (const JailException &e) {
        LOG_ERROR("Jail: {}", e.what());
        return makeErrorEnvelope(e.what());
    }

    // Held from before the cell is published until bootstrap ends, so no call sees a half-built cell
    ExecutionGate::Lock gate;
    try {
        gate = cell->enter();
    } catch (const JailException &e) {
        LOG_ERROR("Jail: {}", e.what());
        return makeErrorEnvelope(e.what());
    }

    std::string baseScript;
    {
        std::lock_guard<std::mutex> lock(cellsMutex_);
        auto it = cells_.find(id);
        if (it != cells_.end()) {
            LOG_DEBUG("Jail: Replacing Cell[{}]", id);
            std::erase_if(replaced_, [](const std::weak_ptr<ScriptingCell> &weak) { return weak.expired(); });
            replaced_.push_back(it->second);
        }
        cells_[id] = cell;
        baseScript = baseScript_;
    }

    try {
        return bootstrap(*cell, baseScript, script);
    } catch (const JailException &e) {
        LOG_ERROR("Jail: Bootstrap of Cell[{}] failed: {}", id, e.what());
        return makeErrorEnvelope(e.what());
    }
}

std::string Jail::bootstrap(ScriptingCell &cell, const std::string &baseScript, const std::string &script) {
    // One gate hold across the whole sequence; nested evaluations re-enter it
    auto lock = cell.enter();

    CellResult result = cell.evaluate(baseScript + ";", "<base>");
    if (result.isError()) {
        LOG_ERROR("Jail: Base script failed in Cell[{}]: {}", cell.getId(), result.getErrorMessage());
        return makeErrorEnvelope(result.getErrorMessage());
    }

    bridge_.install(cell, config_.bridgeName);

    if (!config_.clientLibrary.empty()) {
        result = cell.evaluate(config_.clientLibrary, "<client>");
        if (result.isError()) {
            LOG_ERROR("Jail: Client library failed in Cell[{}]: {}", cell.getId(), result.getErrorMessage());
            return makeErrorEnvelope(result.getErrorMessage());
        }
    }

    result = cell.evaluate(buildPreamble(), "<preamble>");
    if (result.isError()) {
        return makeErrorEnvelope(result.getErrorMessage());
    }

    result = cell.evaluate(script, "<cell:" + cell.getId() + ">");
    if (result.isError()) {
        LOG_WARN("Jail: Script failed in Cell[{}]: {}", cell.getId(), result.getErrorMessage());
        return makeErrorEnvelope(result.getErrorMessage());
    }

    result = cell.evaluate("JSON.stringify(" + config_.catalogName + ")", "<catalog>");
    if (result.isError()) {
        LOG_WARN("Jail: Catalog unavailable in Cell[{}]: {}", cell.getId(), result.getErrorMessage());
        return makeErrorEnvelope(result.getErrorMessage());
    }

    LOG_INFO("Jail: Cell[{}] bootstrapped", cell.getId());
    return makeResultEnvelope(result.getText());
}

std::string Jail::buildPreamble() const {
    // The web3 loader only applies when the client library brought a module loader
    return "if (typeof require === 'function') {\n"
           "    var Web3 = require('web3');\n"
           "    var web3 = new Web3(" +
           config_.bridgeName +
           ");\n"
           "    var Bignumber = require('bignumber.js');\n"
           "}\n"
           "function bn(val) {\n"
           "    return new Bignumber(val);\n"
           "}\n";
}

std::string Jail::call(const std::string &id, const std::string &path, const std::string &args) {
    try {
        getClient();
    } catch (const std::exception &e) {
        LOG_WARN("Jail: call({}) on Cell[{}] rejected: {}", path, id, e.what());
        return makeErrorEnvelope(e.what());
    }

    auto cell = getCell(id);
    if (!cell) {
        return makeErrorEnvelope(cellNotFoundMessage(id));
    }

    try {
        CellResult result = cell->callFunction("call", {path, args});
        if (result.isError()) {
            LOG_DEBUG("Jail: call({}) on Cell[{}] failed: {}", path, id, result.getErrorMessage());
            return makeErrorEnvelope(result.getErrorMessage());
        }
        return makeResultEnvelope(result.getText());
    } catch (const JailException &e) {
        LOG_WARN("Jail: call({}) on Cell[{}] failed ({}): {}", path, id, errorCodeToString(e.code()), e.what());
        return makeErrorEnvelope(e.what());
    }
}

std::shared_ptr<ScriptingCell> Jail::getVM(const std::string &id) const {
    auto cell = getCell(id);
    if (!cell) {
        throw JailException(ErrorCode::CellNotFound, cellNotFoundMessage(id));
    }
    return cell;
}

bool Jail::hasCell(const std::string &id) const {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    return cells_.find(id) != cells_.end();
}

std::vector<std::string> Jail::getCellIds() const {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    std::vector<std::string> ids;
    ids.reserve(cells_.size());
    for (const auto &[id, cell] : cells_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<ScriptingCell> Jail::getCell(const std::string &id) const {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    auto it = cells_.find(id);
    return it != cells_.end() ? it->second : nullptr;
}

std::shared_ptr<IRpcClient> Jail::getClient() {
    std::lock_guard<std::mutex> lock(backendMutex_);
    if (client_) {
        return client_;
    }

    if (!nodeManager_ || !nodeManager_->hasNode()) {
        throw JailException(ErrorCode::NodeUnavailable, "node is not running");
    }

    client_ = nodeManager_->getClient();
    LOG_INFO("Jail: Backend client resolved");
    return client_;
}

std::shared_ptr<IRequestHooks> Jail::getRequestHooks() {
    std::lock_guard<std::mutex> lock(backendMutex_);
    if (hooks_) {
        return hooks_;
    }

    if (!nodeManager_ || !nodeManager_->hasNode()) {
        throw JailException(ErrorCode::NodeUnavailable, "node is not running");
    }

    hooks_ = nodeManager_->getRequestHooks();
    return hooks_;
}

void Jail::setNodeManager(std::shared_ptr<INodeManager> nodeManager) {
    std::lock_guard<std::mutex> lock(backendMutex_);
    nodeManager_ = std::move(nodeManager);
    client_.reset();
    hooks_.reset();
}

void Jail::setBaseScript(const std::string &baseScript) {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    baseScript_ = baseScript;
}

std::string Jail::getBaseScript() const {
    std::lock_guard<std::mutex> lock(cellsMutex_);
    return baseScript_;
}

std::string Jail::cellNotFoundMessage(const std::string &id) {
    return "Cell[" + id + "] doesn't exist.";
}

}  // namespace JAIL
