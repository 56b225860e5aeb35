// STAKEVAULT - Operation Journal Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/service/journal.h>
#include <stakevault/core/serialize.h>
#include <stakevault/util/logging.h>

#include <sstream>

namespace stakevault {
namespace service {

const char* JournalOpToString(JournalOp op) {
    switch (op) {
        case JournalOp::CreateVault:          return "createvault";
        case JournalOp::Deposit:              return "deposit";
        case JournalOp::Redeem:               return "redeem";
        case JournalOp::HarvestAndSettle:     return "harvestandsettle";
        case JournalOp::EnterExitQueue:       return "enterexitqueue";
        case JournalOp::SettleExitTicket:     return "settleexitticket";
        case JournalOp::UpdateRewards:        return "updaterewards";
        case JournalOp::AddOracle:            return "addoracle";
        case JournalOp::RemoveOracle:         return "removeoracle";
        case JournalOp::SetRewardsMinOracles: return "setrewardsminoracles";
        case JournalOp::PrincipalMoved:       return "principalmoved";
        case JournalOp::CreditMevEscrow:      return "creditmevescrow";
        case JournalOp::SetFeeRecipient:      return "setfeerecipient";
        default:                              return "unknown";
    }
}

// ============================================================================
// Journal Entry
// ============================================================================

std::vector<Byte> JournalEntry::Serialize() const {
    DataStream ss;
    ss << static_cast<uint8_t>(op) << time;

    switch (op) {
        case JournalOp::CreateVault:
            ss << caller << vault
               << vaultParams.admin
               << vaultParams.securityDeposit
               << vaultParams.capacity
               << vaultParams.feePercent
               << vaultParams.feeRecipient
               << vaultParams.claimDelay
               << static_cast<uint8_t>(vaultParams.escrowMode);
            break;
        case JournalOp::Deposit:
        case JournalOp::CreditMevEscrow:
            ss << vault << account << amount;
            break;
        case JournalOp::Redeem:
        case JournalOp::EnterExitQueue:
            ss << vault << account << amount << receiver;
            break;
        case JournalOp::HarvestAndSettle:
            ss << vault << harvest.vault << harvest.rewardsRoot << harvest.reward
               << harvest.unlockedSideIncome << harvest.proof;
            break;
        case JournalOp::SettleExitTicket:
            ss << vault << amount << index;
            break;
        case JournalOp::UpdateRewards:
            ss << update.rewardsRoot << update.ipfsHash << update.avgRewardPerSecond
               << update.updateTimestamp << update.signatures;
            break;
        case JournalOp::AddOracle:
        case JournalOp::RemoveOracle:
            ss << caller << account;
            break;
        case JournalOp::SetRewardsMinOracles:
            ss << caller << index;
            break;
        case JournalOp::PrincipalMoved:
            ss << vault << signedAmount;
            break;
        case JournalOp::SetFeeRecipient:
            ss << vault << caller << account;
            break;
    }

    return std::vector<Byte>(ss.data(), ss.data() + ss.size());
}

std::optional<JournalEntry> JournalEntry::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        JournalEntry entry;

        uint8_t op = 0;
        ss >> op >> entry.time;
        if (op < static_cast<uint8_t>(JournalOp::CreateVault) ||
            op > static_cast<uint8_t>(JournalOp::SetFeeRecipient)) {
            return std::nullopt;
        }
        entry.op = static_cast<JournalOp>(op);

        switch (entry.op) {
            case JournalOp::CreateVault: {
                uint8_t mode = 0;
                ss >> entry.caller >> entry.vault
                   >> entry.vaultParams.admin
                   >> entry.vaultParams.securityDeposit
                   >> entry.vaultParams.capacity
                   >> entry.vaultParams.feePercent
                   >> entry.vaultParams.feeRecipient
                   >> entry.vaultParams.claimDelay
                   >> mode;
                if (mode > static_cast<uint8_t>(vault::MevEscrowMode::Own)) {
                    return std::nullopt;
                }
                entry.vaultParams.escrowMode = static_cast<vault::MevEscrowMode>(mode);
                break;
            }
            case JournalOp::Deposit:
            case JournalOp::CreditMevEscrow:
                ss >> entry.vault >> entry.account >> entry.amount;
                break;
            case JournalOp::Redeem:
            case JournalOp::EnterExitQueue:
                ss >> entry.vault >> entry.account >> entry.amount >> entry.receiver;
                break;
            case JournalOp::HarvestAndSettle:
                ss >> entry.vault >> entry.harvest.vault >> entry.harvest.rewardsRoot
                   >> entry.harvest.reward >> entry.harvest.unlockedSideIncome
                   >> entry.harvest.proof;
                break;
            case JournalOp::SettleExitTicket:
                ss >> entry.vault >> entry.amount >> entry.index;
                break;
            case JournalOp::UpdateRewards:
                ss >> entry.update.rewardsRoot >> entry.update.ipfsHash
                   >> entry.update.avgRewardPerSecond >> entry.update.updateTimestamp
                   >> entry.update.signatures;
                break;
            case JournalOp::AddOracle:
            case JournalOp::RemoveOracle:
                ss >> entry.caller >> entry.account;
                break;
            case JournalOp::SetRewardsMinOracles:
                ss >> entry.caller >> entry.index;
                break;
            case JournalOp::PrincipalMoved:
                ss >> entry.vault >> entry.signedAmount;
                break;
            case JournalOp::SetFeeRecipient:
                ss >> entry.vault >> entry.caller >> entry.account;
                break;
        }

        if (!ss.empty()) {
            return std::nullopt;
        }
        return entry;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string JournalEntry::ToString() const {
    std::ostringstream ss;
    ss << JournalOpToString(op);
    if (!vault.IsNull()) {
        ss << " vault=" << vault.ToHex();
    }
    if (amount != 0) {
        ss << " amount=" << amount;
    }
    if (time != 0) {
        ss << " time=" << time;
    }
    return ss.str();
}

// ============================================================================
// Journal
// ============================================================================

Journal::Journal(db::Database& db) : db_(db) {}

db::Status Journal::Load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::JOURNAL_HEAD), &value);
    if (s.IsNotFound()) {
        head_ = 0;
        return db::Status::Ok();
    }
    if (!s.ok()) {
        return s;
    }

    uint64_t head = 0;
    if (!db::DeserializeFromString(value, head)) {
        return db::Status::Corruption("malformed journal head");
    }
    head_ = head;

    LOG_DEBUG(util::LogCategory::DB) << "Journal head at " << head_;
    return db::Status::Ok();
}

db::Status Journal::Append(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Byte> bytes = entry.Serialize();
    uint64_t next = head_ + 1;

    db::WriteBatch batch;
    batch.Put(db::MakeSequenceKey(db::prefix::JOURNAL, head_),
              db::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    batch.Put(db::MakeKey(db::prefix::JOURNAL_HEAD), db::SerializeToString(next));

    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Journal append failed: " << s.ToString();
        return s;
    }

    LOG_TRACE(util::LogCategory::DB) << "Journal " << head_ << ": " << entry.ToString();
    head_ = next;
    return s;
}

db::Status Journal::ForEach(
    const std::function<db::Status(uint64_t, const JournalEntry&)>& visitor) const {
    uint64_t head = Head();

    auto it = db_.NewIterator(db::ReadOptions());
    uint64_t expected = 0;
    for (it->Seek(db::MakeKey(db::prefix::JOURNAL)); it->Valid() && expected < head; it->Next()) {
        auto seq = db::ParseSequenceKey(db::prefix::JOURNAL, it->key());
        if (!seq) {
            break;
        }
        if (*seq != expected) {
            return db::Status::Corruption("journal gap at sequence " + std::to_string(expected));
        }

        db::Slice value = it->value();
        auto entry = JournalEntry::Deserialize(reinterpret_cast<const Byte*>(value.data()),
                                               value.size());
        if (!entry) {
            return db::Status::Corruption("undecodable journal entry " + std::to_string(*seq));
        }

        db::Status s = visitor(*seq, *entry);
        if (!s.ok()) {
            return s;
        }
        ++expected;
    }

    if (!it->status().ok()) {
        return it->status();
    }
    if (expected != head) {
        return db::Status::Corruption("journal ends at " + std::to_string(expected) +
                                      ", head is " + std::to_string(head));
    }
    return db::Status::Ok();
}

uint64_t Journal::Head() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return head_;
}

} // namespace service
} // namespace stakevault
