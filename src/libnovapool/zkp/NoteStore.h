#pragma once

#include <libnovapool/zkp/Note.h>
#include <xrpl/basics/base_uint.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace novapool {
namespace zkp {

/** A note the user can spend, keyed by its commitment. */
struct StoredNote
{
    Note note;
    FieldT commitment;
    std::uint64_t leafIndex = 0;
    // Nullifier revealed when this note is spent at leafIndex
    FieldT nullifier;
    std::uint32_t createdAtLedger = 0;
    bool spent = false;
    std::optional<std::uint32_t> spentAtLedger;

    Json::Value
    toJson() const;

    static StoredNote
    fromJson(Json::Value const& json);
};

class NoteStore
{
public:
    virtual ~NoteStore() = default;

    /** Insert or replace the note with the same commitment. */
    virtual void
    put(StoredNote const& note) = 0;

    virtual std::optional<StoredNote>
    get(FieldT const& commitment) const = 0;

    virtual std::optional<StoredNote>
    getByNullifier(FieldT const& nullifier) const = 0;

    /** @return false if no note has this commitment */
    virtual bool
    markSpent(FieldT const& commitment, std::uint32_t ledger) = 0;

    virtual std::vector<StoredNote>
    list(bool unspentOnly = false) const = 0;

    virtual void
    remove(FieldT const& commitment) = 0;

    virtual void
    clear() = 0;

    /** Sum of unspent note amounts. */
    Amount
    balance() const;
};

/**
 * In-process note store.
 *
 * Notes can be exported to and imported from a versioned JSON document:
 *
 *   { "version": 1, "notes": [ {...}, ... ] }
 *
 * Import adds unknown notes and carries over spent flags for known ones.
 */
class MemoryNoteStore : public NoteStore
{
public:
    static constexpr int EXPORT_VERSION = 1;

    explicit MemoryNoteStore(beast::Journal journal);

    void
    put(StoredNote const& note) override;

    std::optional<StoredNote>
    get(FieldT const& commitment) const override;

    std::optional<StoredNote>
    getByNullifier(FieldT const& nullifier) const override;

    bool
    markSpent(FieldT const& commitment, std::uint32_t ledger) override;

    std::vector<StoredNote>
    list(bool unspentOnly = false) const override;

    void
    remove(FieldT const& commitment) override;

    void
    clear() override;

    std::size_t
    size() const;

    Json::Value
    exportNotes() const;

    /**
     * @return number of notes added
     * @throws std::invalid_argument on an unsupported version or bad note
     */
    std::size_t
    importNotes(Json::Value const& document);

private:
    beast::Journal j_;
    mutable std::mutex mutex_;
    // Ordered by commitment so listings are stable
    std::map<ripple::uint256, StoredNote> notes_;
};

}  // namespace zkp
}  // namespace novapool
