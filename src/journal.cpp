#include "agentreg/journal.hpp"
#include <format>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

#ifdef AGENTREG_HAVE_ROCKSDB
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#endif

namespace agentreg
{

    Result<uint64_t> persist(const EventLog &log, EventJournal &journal)
    {
        const uint64_t start = journal.size();
        if (start > log.size())
        {
            return std::unexpected(RegistryError::storage(
                std::format("Journal holds {} events but the ledger only {}", start, log.size())));
        }

        uint64_t written = 0;
        for (const auto &event : log.since(start))
        {
            if (auto res = journal.append(event); !res)
                return std::unexpected(res.error());
            ++written;
        }
        spdlog::debug("persisted {} events to journal", written);
        return written;
    }

#ifdef AGENTREG_HAVE_ROCKSDB
    namespace
    {
        std::string sequence_key(uint64_t sequence)
        {
            return std::format("event:{:020}", sequence);
        }
    } // namespace

    class RocksDbEventJournal::Impl
    {
    public:
        explicit Impl(const JournalConfig &cfg)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw std::runtime_error(std::format("RocksDB open failed: {}", status.ToString()));
            }
            count = scan_count();
        }

        ~Impl()
        {
            delete db;
        }

        Result<void> append(const Event &event)
        {
            if (event.sequence != count)
            {
                return std::unexpected(RegistryError::storage(
                    std::format("Out-of-order append: expected sequence {}, got {}", count, event.sequence)));
            }

            rocksdb::WriteOptions write_options;
            write_options.sync = true;
            std::string value;
            try
            {
                value = event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
            }
            catch (const nlohmann::json::type_error &e)
            {
                return std::unexpected(RegistryError::storage(
                    std::format("Event {} cannot be serialized: {}", event.sequence, e.what())));
            }
            auto status = db->Put(write_options, sequence_key(event.sequence), value);
            if (!status.ok())
            {
                return std::unexpected(RegistryError::storage(std::format("RocksDB Put failed: {}", status.ToString())));
            }
            ++count;
            return {};
        }

        Result<std::vector<Event>> load_all()
        {
            std::vector<Event> out;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek("event:"); it->Valid() && it->key().starts_with("event:"); it->Next())
            {
                nlohmann::json parsed;
                try
                {
                    parsed = nlohmann::json::parse(it->value().ToString());
                }
                catch (const nlohmann::json::exception &e)
                {
                    return std::unexpected(RegistryError::parsing(
                        std::format("Corrupt journal entry {}: {}", it->key().ToString(), e.what())));
                }
                auto event = Event::from_json(parsed);
                if (!event)
                    return std::unexpected(event.error());
                out.push_back(std::move(*event));
            }
            if (!it->status().ok())
            {
                return std::unexpected(RegistryError::storage(std::format("RocksDB scan failed: {}", it->status().ToString())));
            }
            return out;
        }

        uint64_t size() const { return count; }

    private:
        uint64_t scan_count()
        {
            uint64_t n = 0;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek("event:"); it->Valid() && it->key().starts_with("event:"); it->Next())
                ++n;
            return n;
        }

        rocksdb::DB *db{nullptr};
        uint64_t count{0};
    };

    RocksDbEventJournal::RocksDbEventJournal(const JournalConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbEventJournal::~RocksDbEventJournal() = default;

    Result<void> RocksDbEventJournal::append(const Event &event)
    {
        return impl_->append(event);
    }

    Result<std::vector<Event>> RocksDbEventJournal::load_all()
    {
        return impl_->load_all();
    }

    uint64_t RocksDbEventJournal::size()
    {
        return impl_->size();
    }
#endif // AGENTREG_HAVE_ROCKSDB

    Result<std::unique_ptr<EventJournal>> open_journal(const JournalConfig &cfg)
    {
        if (!cfg.enabled)
            return std::unexpected(RegistryError::config("Journal is disabled in configuration"));
#ifdef AGENTREG_HAVE_ROCKSDB
        try
        {
            return std::unique_ptr<EventJournal>(std::make_unique<RocksDbEventJournal>(cfg));
        }
        catch (const std::runtime_error &e)
        {
            return std::unexpected(RegistryError::storage(e.what()));
        }
#else
        return std::unexpected(RegistryError::config("agentreg built without RocksDB; journal unavailable"));
#endif
    }

} // namespace agentreg
