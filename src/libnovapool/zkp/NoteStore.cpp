#include <libnovapool/zkp/NoteStore.h>

#include <xrpl/basics/Log.h>

#include <stdexcept>

namespace novapool {
namespace zkp {

Json::Value
StoredNote::toJson() const
{
    Json::Value json = note.toJson();
    json["commitment"] = fieldToHex(commitment);
    json["nullifier"] = fieldToHex(nullifier);
    json["leafIndex"] = static_cast<Json::UInt>(leafIndex);
    json["createdAtLedger"] = createdAtLedger;
    json["spent"] = spent;
    if (spentAtLedger)
        json["spentAtLedger"] = *spentAtLedger;
    return json;
}

StoredNote
StoredNote::fromJson(Json::Value const& json)
{
    if (!json.isObject() || !json.isMember("commitment") ||
        !json.isMember("nullifier") || !json.isMember("leafIndex"))
        throw std::invalid_argument(
            "Stored note requires commitment, nullifier, leafIndex");

    StoredNote stored;
    stored.note = Note::fromJson(json);
    stored.commitment = fieldFromHex(json["commitment"].asString());
    stored.nullifier = fieldFromHex(json["nullifier"].asString());
    stored.leafIndex = json["leafIndex"].asUInt();
    stored.createdAtLedger = json["createdAtLedger"].asUInt();
    stored.spent = json["spent"].asBool();
    if (json.isMember("spentAtLedger"))
        stored.spentAtLedger = json["spentAtLedger"].asUInt();
    return stored;
}

Amount
NoteStore::balance() const
{
    Amount total = 0;
    for (auto const& stored : list(true))
        total += stored.note.amount;
    return total;
}

MemoryNoteStore::MemoryNoteStore(beast::Journal journal) : j_(journal)
{
}

void
MemoryNoteStore::put(StoredNote const& note)
{
    std::lock_guard lock(mutex_);
    notes_[fieldToUint256(note.commitment)] = note;
    JLOG(j_.debug()) << "Saved note at index " << note.leafIndex;
}

std::optional<StoredNote>
MemoryNoteStore::get(FieldT const& commitment) const
{
    std::lock_guard lock(mutex_);
    auto const it = notes_.find(fieldToUint256(commitment));
    if (it == notes_.end())
        return std::nullopt;
    return it->second;
}

std::optional<StoredNote>
MemoryNoteStore::getByNullifier(FieldT const& nullifier) const
{
    std::lock_guard lock(mutex_);
    for (auto const& [key, stored] : notes_)
    {
        if (stored.nullifier == nullifier)
            return stored;
    }
    return std::nullopt;
}

bool
MemoryNoteStore::markSpent(FieldT const& commitment, std::uint32_t ledger)
{
    std::lock_guard lock(mutex_);
    auto const it = notes_.find(fieldToUint256(commitment));
    if (it == notes_.end())
        return false;

    it->second.spent = true;
    it->second.spentAtLedger = ledger;
    JLOG(j_.debug()) << "Marked note at index " << it->second.leafIndex
                     << " as spent";
    return true;
}

std::vector<StoredNote>
MemoryNoteStore::list(bool unspentOnly) const
{
    std::lock_guard lock(mutex_);
    std::vector<StoredNote> result;
    result.reserve(notes_.size());
    for (auto const& [key, stored] : notes_)
    {
        if (!unspentOnly || !stored.spent)
            result.push_back(stored);
    }
    return result;
}

void
MemoryNoteStore::remove(FieldT const& commitment)
{
    std::lock_guard lock(mutex_);
    notes_.erase(fieldToUint256(commitment));
}

void
MemoryNoteStore::clear()
{
    std::lock_guard lock(mutex_);
    notes_.clear();
    JLOG(j_.info()) << "Cleared all notes";
}

std::size_t
MemoryNoteStore::size() const
{
    std::lock_guard lock(mutex_);
    return notes_.size();
}

Json::Value
MemoryNoteStore::exportNotes() const
{
    Json::Value doc(Json::objectValue);
    doc["version"] = EXPORT_VERSION;
    Json::Value& notes = doc["notes"] = Json::Value(Json::arrayValue);
    for (auto const& stored : list())
        notes.append(stored.toJson());
    return doc;
}

std::size_t
MemoryNoteStore::importNotes(Json::Value const& document)
{
    if (!document.isObject() || !document.isMember("version") ||
        document["version"].asInt() != EXPORT_VERSION)
        throw std::invalid_argument(
            "Unsupported export version: " + document["version"].asString());

    Json::Value const& notes = document["notes"];
    if (!notes.isArray())
        throw std::invalid_argument("Export has no notes array");

    // Parse everything first so a bad entry leaves the store untouched
    std::vector<StoredNote> parsed;
    for (Json::UInt i = 0; i < notes.size(); ++i)
        parsed.push_back(StoredNote::fromJson(notes[i]));

    std::size_t imported = 0;
    std::lock_guard lock(mutex_);
    for (auto& stored : parsed)
    {
        auto const key = fieldToUint256(stored.commitment);
        auto const it = notes_.find(key);
        if (it == notes_.end())
        {
            notes_.emplace(key, std::move(stored));
            ++imported;
        }
        else if (!it->second.spent && stored.spent)
        {
            it->second.spent = true;
            it->second.spentAtLedger = stored.spentAtLedger;
        }
    }
    JLOG(j_.info()) << "Imported " << imported << " notes";
    return imported;
}

}  // namespace zkp
}  // namespace novapool
