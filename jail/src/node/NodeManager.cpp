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

#include "node/NodeManager.h"
#include "common/JailError.h"
#include "common/Logger.h"
#include "node/RequestContextHooks.h"
#include "rpc/HttpRpcClient.h"

namespace JAIL {

std::string RestartTolerantClient::call(const std::string &method, const json &params) {
    return currentBackend()->call(method, params);
}

void RestartTolerantClient::setBackend(std::shared_ptr<IRpcClient> backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_ = std::move(backend);
}

bool RestartTolerantClient::hasBackend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_ != nullptr;
}

std::shared_ptr<IRpcClient> RestartTolerantClient::currentBackend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_) {
        throw JailException(ErrorCode::NodeUnavailable, "No running node");
    }
    return backend_;
}

NodeManager::NodeManager(ClientFactory factory, std::shared_ptr<IRequestHooks> hooks)
    : factory_(std::move(factory)), hooks_(std::move(hooks)) {
    if (!factory_) {
        factory_ = [](const NodeConfig &config) { return std::make_shared<HttpRpcClient>(config); };
    }
    if (!hooks_) {
        hooks_ = std::make_shared<RequestContextHooks>();
    }
    handle_ = std::make_shared<RestartTolerantClient>();
}

NodeManager::~NodeManager() {
    handle_->setBackend(nullptr);
}

void NodeManager::attach(const NodeConfig &config) {
    auto backend = factory_(config);
    if (!backend) {
        throw JailException(ErrorCode::NodeUnavailable, "Client factory returned no client for " + config.url);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    handle_->setBackend(std::move(backend));
    ++generation_;
    LOG_INFO("NodeManager: Attached to node {} (generation {})", config.url, generation_);
}

void NodeManager::restart(const NodeConfig &config) {
    LOG_INFO("NodeManager: Restarting node connection");
    attach(config);
}

void NodeManager::detach() {
    handle_->setBackend(nullptr);
    LOG_INFO("NodeManager: Detached from node");
}

bool NodeManager::hasNode() const {
    return handle_->hasBackend();
}

std::shared_ptr<IRpcClient> NodeManager::getClient() {
    if (!hasNode()) {
        throw JailException(ErrorCode::NodeUnavailable, "No running node");
    }
    return handle_;
}

std::shared_ptr<IRequestHooks> NodeManager::getRequestHooks() {
    if (!hasNode()) {
        throw JailException(ErrorCode::NodeUnavailable, "No running node");
    }
    return hooks_;
}

size_t NodeManager::getGeneration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace JAIL
