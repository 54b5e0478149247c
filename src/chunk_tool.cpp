// blobstream-chunks: read-only inspection tool for the LMDB chunk store.
//
// Only links against LMDB; safe to run while the daemon is serving.
//
// Usage: blobstream-chunks --db <path> <subcommand> [args]
//
// Subcommands:
//   stat                 Entry count, tree depth, DB size
//   count                Total chunk objects (fast)
//   list <blob-id>       Chunks of one blob, every stored version
//   blobs                One line per stored (blob, version) with a sequence check
//   export               Key and size of every chunk object

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <lmdb.h>
#include <string>

namespace {

constexpr const char* CHUNK_KEY_PREFIX = "chunks/";

void print_usage() {
    fprintf(stderr,
        "Usage: blobstream-chunks --db <path> <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  stat                          Entry count, tree depth, DB size\n"
        "  count                         Total chunk objects (fast)\n"
        "  list <blob-id>                Chunks of one blob (all versions)\n"
        "  blobs                         Per (blob, version): chunks, bytes, gaps\n"
        "  export [--format csv|tsv]     Key and size of every chunk object\n"
        "\n"
        "Options:\n"
        "  --db <path>                   Chunk store LMDB directory\n"
        "                                (default: $BLOBSTREAM_DATA_DIR/chunks or ./chunks)\n"
        "  --limit <N>                   Max entries to output\n"
        "  --output <file>               Write output to file (uses 1MB buffer)\n"
        "  --help                        Show this help\n"
    );
}

// Iterate keys starting with `prefix`, printing "<key><sep><size>".
// Returns the number of entries printed, or -1 on cursor error.
int64_t dump_prefix(MDB_txn* txn, MDB_dbi dbi, const std::string& prefix, const char* sep,
                    uint64_t limit, FILE* out) {
    MDB_cursor* cursor = nullptr;
    int rc = mdb_cursor_open(txn, dbi, &cursor);
    if (rc) {
        fprintf(stderr, "mdb_cursor_open: %s\n", mdb_strerror(rc));
        return -1;
    }

    MDB_val k = {prefix.size(), const_cast<char*>(prefix.data())};
    MDB_val v;
    int64_t count = 0;
    uint64_t total_bytes = 0;

    rc = mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
    while (rc == 0) {
        std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
        if (key.compare(0, prefix.size(), prefix) != 0) break;

        fprintf(out, "%s%s%zu\n", key.c_str(), sep, v.mv_size);
        total_bytes += v.mv_size;

        ++count;
        if (count % 10000000 == 0) {
            fprintf(stderr, "\rExported %" PRId64 "M entries...", count / 1000000);
        }
        if (limit > 0 && static_cast<uint64_t>(count) >= limit) break;
        rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cursor);

    if (rc != 0 && rc != MDB_NOTFOUND) {
        fprintf(stderr, "mdb_cursor_get: %s\n", mdb_strerror(rc));
        return -1;
    }
    fprintf(stderr, "%" PRId64 " chunks, %" PRIu64 " bytes\n", count, total_bytes);
    return count;
}

// Walk every chunk key and summarise each (blob, version) run. Sequence
// numbers must start at 0 and be contiguous; a run that is not is reported
// as "gap". Returns the number of runs with gaps, or -1 on cursor error.
int64_t summarize_blobs(MDB_txn* txn, MDB_dbi dbi, const char* sep, FILE* out) {
    MDB_cursor* cursor = nullptr;
    int rc = mdb_cursor_open(txn, dbi, &cursor);
    if (rc) {
        fprintf(stderr, "mdb_cursor_open: %s\n", mdb_strerror(rc));
        return -1;
    }

    const std::string prefix = CHUNK_KEY_PREFIX;
    std::string run;  // "<blob-id>/<version>/"
    uint64_t run_chunks = 0;
    uint64_t run_bytes = 0;
    bool run_gap = false;
    int64_t runs = 0;
    int64_t gaps = 0;

    auto flush_run = [&] {
        if (run.empty()) return;
        auto slash = run.find('/');
        fprintf(out, "%s%s%s%s%" PRIu64 "%s%" PRIu64 "%s%s\n",
                run.substr(0, slash).c_str(), sep,
                run.substr(slash + 1, run.size() - slash - 2).c_str(), sep,
                run_chunks, sep, run_bytes, sep, run_gap ? "gap" : "ok");
        ++runs;
        if (run_gap) ++gaps;
    };

    MDB_val k = {prefix.size(), const_cast<char*>(prefix.data())};
    MDB_val v;
    rc = mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
    while (rc == 0) {
        std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
        if (key.compare(0, prefix.size(), prefix) != 0) break;

        auto seq_pos = key.rfind('/');
        auto id_end = key.find('/', prefix.size());
        if (id_end == std::string::npos || id_end >= seq_pos) {
            fprintf(stderr, "skipping malformed key: %s\n", key.c_str());
            rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
            continue;
        }
        std::string key_run = key.substr(prefix.size(), seq_pos + 1 - prefix.size());
        uint64_t seq = strtoull(key.c_str() + seq_pos + 1, nullptr, 10);

        if (key_run != run) {
            flush_run();
            run = key_run;
            run_chunks = 0;
            run_bytes = 0;
            run_gap = false;
        }
        if (seq != run_chunks) run_gap = true;
        ++run_chunks;
        run_bytes += v.mv_size;

        rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
    }
    flush_run();
    mdb_cursor_close(cursor);

    if (rc != 0 && rc != MDB_NOTFOUND) {
        fprintf(stderr, "mdb_cursor_get: %s\n", mdb_strerror(rc));
        return -1;
    }
    fprintf(stderr, "%" PRId64 " blob versions, %" PRId64 " with gaps\n", runs, gaps);
    return gaps;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string subcommand;
    std::string blob_id;
    std::string format_str = "tsv";
    std::string output_file;
    uint64_t limit = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--db") {
            if (++i >= argc) { fprintf(stderr, "--db requires argument\n"); return 1; }
            db_path = argv[i];
        } else if (arg == "--limit") {
            if (++i >= argc) { fprintf(stderr, "--limit requires argument\n"); return 1; }
            limit = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--format") {
            if (++i >= argc) { fprintf(stderr, "--format requires argument\n"); return 1; }
            format_str = argv[i];
        } else if (arg == "--output") {
            if (++i >= argc) { fprintf(stderr, "--output requires argument\n"); return 1; }
            output_file = argv[i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (subcommand == "list" && blob_id.empty()) {
            blob_id = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }
    if (subcommand == "list" && blob_id.empty()) {
        fprintf(stderr, "Usage: blobstream-chunks list <blob-id>\n");
        return 1;
    }

    if (db_path.empty()) {
        const char* data_dir = getenv("BLOBSTREAM_DATA_DIR");
        db_path = data_dir ? std::string(data_dir) + "/chunks" : "chunks";
    }

    MDB_env* env = nullptr;
    int rc = mdb_env_create(&env);
    if (rc) {
        fprintf(stderr, "mdb_env_create: %s\n", mdb_strerror(rc));
        return 1;
    }

    rc = mdb_env_open(env, db_path.c_str(), MDB_RDONLY, 0664);
    if (rc) {
        fprintf(stderr, "Cannot open chunk store at %s: %s\n", db_path.c_str(), mdb_strerror(rc));
        mdb_env_close(env);
        return 1;
    }

    MDB_txn* txn = nullptr;
    rc = mdb_txn_begin(env, nullptr, MDB_RDONLY, &txn);
    if (rc) {
        fprintf(stderr, "mdb_txn_begin: %s\n", mdb_strerror(rc));
        mdb_env_close(env);
        return 1;
    }

    MDB_dbi dbi;
    rc = mdb_dbi_open(txn, nullptr, 0, &dbi);
    if (rc) {
        fprintf(stderr, "mdb_dbi_open: %s\n", mdb_strerror(rc));
        mdb_txn_abort(txn);
        mdb_env_close(env);
        return 1;
    }

    FILE* out = stdout;
    if (!output_file.empty()) {
        out = fopen(output_file.c_str(), "w");
        if (!out) {
            fprintf(stderr, "Cannot open output file: %s\n", output_file.c_str());
            mdb_txn_abort(txn);
            mdb_env_close(env);
            return 1;
        }
        setvbuf(out, nullptr, _IOFBF, 1024 * 1024);
    }

    const char* sep = (format_str == "csv") ? "," : "\t";
    int status = 0;

    if (subcommand == "stat") {
        MDB_stat stat;
        rc = mdb_stat(txn, dbi, &stat);
        if (rc) {
            fprintf(stderr, "mdb_stat: %s\n", mdb_strerror(rc));
            status = 1;
        } else {
            MDB_envinfo info;
            mdb_env_info(env, &info);

            fprintf(out, "entries:     %zu\n", stat.ms_entries);
            fprintf(out, "depth:       %u\n", stat.ms_depth);
            fprintf(out, "page_size:   %u\n", stat.ms_psize);
            fprintf(out, "leaf_pgs:    %zu\n", stat.ms_leaf_pages);
            fprintf(out, "overflow_pgs:%zu\n", stat.ms_overflow_pages);
            uint64_t total_pages = stat.ms_branch_pages + stat.ms_leaf_pages + stat.ms_overflow_pages;
            uint64_t db_bytes = total_pages * stat.ms_psize;
            fprintf(out, "db_size:     %" PRIu64 " bytes (%.2f MB)\n",
                    db_bytes, static_cast<double>(db_bytes) / (1024.0 * 1024));
            fprintf(out, "map_size:    %" PRIu64 " bytes (%.2f GB)\n",
                    static_cast<uint64_t>(info.me_mapsize),
                    static_cast<double>(info.me_mapsize) / (1024.0 * 1024 * 1024));
        }
    } else if (subcommand == "count") {
        MDB_stat stat;
        rc = mdb_stat(txn, dbi, &stat);
        if (rc) {
            fprintf(stderr, "mdb_stat: %s\n", mdb_strerror(rc));
            status = 1;
        } else {
            fprintf(out, "%zu\n", stat.ms_entries);
        }
    } else if (subcommand == "list") {
        std::string prefix = std::string(CHUNK_KEY_PREFIX) + blob_id + "/";
        auto n = dump_prefix(txn, dbi, prefix, sep, limit, out);
        if (n < 0) {
            status = 1;
        } else if (n == 0) {
            fprintf(stderr, "No chunks stored for %s\n", blob_id.c_str());
            status = 2;
        }
    } else if (subcommand == "blobs") {
        auto gaps = summarize_blobs(txn, dbi, sep, out);
        if (gaps < 0) {
            status = 1;
        } else if (gaps > 0) {
            status = 3;
        }
    } else if (subcommand == "export") {
        if (dump_prefix(txn, dbi, CHUNK_KEY_PREFIX, sep, limit, out) < 0) status = 1;
    } else {
        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        status = 1;
    }

    if (out != stdout) fclose(out);
    mdb_txn_abort(txn);
    mdb_env_close(env);
    return status;
}
