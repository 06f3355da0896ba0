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

#pragma once

#include "common/JailConfig.h"
#include "node/INodeManager.h"
#include "scripting/RpcBridge.h"
#include "scripting/ScriptingCell.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace JAIL {

/**
 * @brief Registry of scripting cells sharing one node connection
 *
 * Cells are keyed by session id. Every cell is seeded with the shared base
 * script and the RPC bridge, and all cells dispatch through the same
 * restart-tolerant client and request hooks, resolved lazily from the node
 * manager and cached once resolved (a failed resolution is retried next time).
 *
 * Public entry points never throw; failures come back as {"error": "..."}.
 *
 * @code
 * auto nodes = std::make_shared<JAIL::NodeManager>();
 * nodes->attach(nodeConfig);
 *
 * JAIL::Jail jail(JAIL::JailConfig{}, nodes, baseScript);
 * jail.parse("chat-1", "var _status_catalog = {ping: function(){return 'pong'}};");
 * jail.call("chat-1", "ping", "[]");  // {"result":"pong"}
 * @endcode
 *
 * A process-wide instance is also available through initialize()/getInstance().
 */
class Jail : public IBackendAccessor {
public:
    Jail(JailConfig config, std::shared_ptr<INodeManager> nodeManager, std::string baseScript = "");
    ~Jail() override;

    Jail(const Jail &) = delete;
    Jail &operator=(const Jail &) = delete;

    /**
     * @brief Set the base script of the process-wide instance, creating it if needed
     *
     * Always returns the same instance; only the base script is replaced.
     */
    static Jail &initialize(const std::string &baseScript);

    /**
     * @brief Process-wide instance, created empty on first use
     */
    static Jail &getInstance();

    /**
     * @brief Discard the process-wide instance and all of its cells (for testing)
     */
    static void reset();

    static bool isInitialized();

    /**
     * @brief Create (or replace) the cell for id and bootstrap it
     *
     * Seeds the cell with, in order: the base script, the bridge object, the
     * configured client library with its preamble, script, and finally reads
     * the catalog global as JSON.
     *
     * @return {"result": <catalog JSON>} or {"error": "..."}
     */
    std::string parse(const std::string &id, const std::string &script);

    /**
     * @brief Invoke call(path, args) inside the cell for id
     * @return {"result": ...} or {"error": "..."}
     */
    std::string call(const std::string &id, const std::string &path, const std::string &args);

    /**
     * @brief Underlying cell for direct script interaction
     * @throws JailException(CellNotFound) if no cell exists for id
     */
    std::shared_ptr<ScriptingCell> getVM(const std::string &id) const;

    bool hasCell(const std::string &id) const;
    std::vector<std::string> getCellIds() const;

    /**
     * @brief Cell for id, nullptr if absent
     */
    std::shared_ptr<ScriptingCell> getCell(const std::string &id) const;

    // IBackendAccessor
    std::shared_ptr<IRpcClient> getClient() override;
    std::shared_ptr<IRequestHooks> getRequestHooks() override;

    /**
     * @brief Switch node manager; cached client and hooks are dropped
     */
    void setNodeManager(std::shared_ptr<INodeManager> nodeManager);

    void setBaseScript(const std::string &baseScript);
    std::string getBaseScript() const;

    const JailConfig &getConfig() const {
        return config_;
    }

private:
    std::string bootstrap(ScriptingCell &cell, const std::string &baseScript, const std::string &script);
    std::string buildPreamble() const;

    static std::string cellNotFoundMessage(const std::string &id);

    JailConfig config_;
    RpcBridge bridge_;

    mutable std::mutex cellsMutex_;
    std::map<std::string, std::shared_ptr<ScriptingCell>> cells_;
    // Replaced cells that callers may still hold; detached from the bridge on destruction
    std::vector<std::weak_ptr<ScriptingCell>> replaced_;
    std::string baseScript_;

    mutable std::mutex backendMutex_;
    std::shared_ptr<INodeManager> nodeManager_;
    std::shared_ptr<IRpcClient> client_;
    std::shared_ptr<IRequestHooks> hooks_;

    static std::unique_ptr<Jail> instance_;
    static std::mutex instanceMutex_;
};

}  // namespace JAIL
