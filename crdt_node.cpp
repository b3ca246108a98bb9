// crdt_node.cpp
#include "crdt_node.hpp"
#include "crdt_errors.hpp"
#include "crdt_log.hpp"

CrdtNode::CrdtNode(NodeConfig config, std::shared_ptr<SyncTransport> transport, const SchemaSetup &schemas,
                   const CrdtActorId &actor)
    : config_(std::move(config)) {
  Ledger::register_schemas(schemas_);
  if (schemas) {
    schemas(schemas_);
  }

  storage_ = std::make_unique<DocumentStorage>(config_.database_path.c_str());
  NodeIdentity identity = actor.empty() ? storage_->load_or_create_identity() : storage_->load_or_create_identity(actor);
  ctx_ = std::make_unique<NodeContext>(identity.actor, identity.clock);
  store_ = std::make_unique<DocumentStore>(*ctx_, schemas_, config_.store, storage_.get());
  load_report_ = store_->load();
  ledger_ = std::make_unique<Ledger>(*store_);
  if (transport) {
    sync_ = std::make_unique<PeerManager>(*store_, std::move(transport), config_.sync);
  }

  CRDT_LOG_INFO("node", "actor " << ctx_->actor() << " at clock " << ctx_->clock() << ", " << load_report_.loaded
                                 << " documents loaded");
  if (!load_report_.corrupted.empty()) {
    CRDT_LOG_WARN("node", load_report_.corrupted.size() << " corrupted documents skipped");
  }
}

CrdtNode::~CrdtNode() { stop(); }

PeerManager &CrdtNode::sync() {
  if (!sync_) {
    throw InvalidArgument("Node " + ctx_->actor() + " has no transport");
  }
  return *sync_;
}

void CrdtNode::enable_reconciliation(CrdtVector<std::shared_ptr<CommitteeMember>> committee) {
  if (scheduler_) {
    scheduler_->stop();
  }
  scheduler_.reset();
  engine_ = std::make_unique<ReconciliationEngine>(*ledger_, std::move(committee), config_.reconciliation);
  scheduler_ = std::make_unique<ReconciliationScheduler>(*engine_, config_.reconciliation.interval);
}

void CrdtNode::start() {
  if (sync_) {
    sync_->start();
  }
  if (scheduler_) {
    scheduler_->start();
  }
}

void CrdtNode::stop() {
  if (scheduler_) {
    scheduler_->stop();
  }
  if (sync_) {
    sync_->stop();
  }
}
