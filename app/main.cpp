#include "commands/backfill.hpp"
#include "commands/flatten.hpp"
#include "commands/query.hpp"
#include "commands/upsert.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-index upsert [args]\n"
        << "  resume-index flatten [args]\n"
        << "  resume-index backfill [args]\n"
        << "  resume-index query [args]\n"
        << "  resume-index help\n";
    return 1;
}

static int print_upsert_help() {
    std::cerr
        << "usage:\n"
        << "  resume-index upsert --profile <json> [options]\n"
        << "\n"
        << "options:\n"
        << "  --profile <path>             (required) extracted profile JSON\n"
        << "  --db <path>                  default: outputs/resume_profiles.db\n"
        << "  --id <str>                   default: profile file stem\n"
        << "  --provenance <str>           default: unknown\n"
        << "  --source <path>              optional: source document path\n";
    return 0;
}

static int print_flatten_help() {
    std::cerr
        << "usage:\n"
        << "  resume-index flatten --id <external_id> [--db <path>]\n"
        << "  resume-index flatten --profile <json>\n";
    return 0;
}

static int print_backfill_help() {
    std::cerr
        << "usage:\n"
        << "  resume-index backfill [options]\n"
        << "\n"
        << "options:\n"
        << "  --db <path>                  default: outputs/resume_profiles.db\n"
        << "  --index_dir <dir>            default: outputs/indexes\n"
        << "  --mode full|missing          default: full\n"
        << "  --batch_size <n>             default: 32\n"
        << "\n"
        << "embeddings:\n"
        << "  --provider openai|onnx       default: openai (needs OPENAI_API_KEY)\n"
        << "  --model <str>                default: text-embedding-3-large (onnx: model path)\n"
        << "  --vocab <path>               default: models/emb/vocab.txt (onnx only)\n"
        << "  --max_len <n>                default: 256 (onnx only)\n";
    return 0;
}

static int print_query_help() {
    std::cerr
        << "usage:\n"
        << "  resume-index query --index <artifact> (--vector <json> | --profile <json>) [options]\n"
        << "\n"
        << "options:\n"
        << "  --index <path>               (required) index artifact\n"
        << "  --vector <path>              JSON array, already embedded query\n"
        << "  --profile <path>             profile JSON, flattened and embedded first\n"
        << "  --db <path>                  optional: store used to resolve positions\n"
        << "  --topk <n>                   default: 5\n"
        << "  --provider/--model/--vocab/--max_len   as for backfill\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "upsert"   && wants_help) return print_upsert_help();
    if (cmd == "flatten"  && wants_help) return print_flatten_help();
    if (cmd == "backfill" && wants_help) return print_backfill_help();
    if (cmd == "query"    && wants_help) return print_query_help();

    if (cmd == "upsert")   return cmd_upsert(argc - 1, argv + 1);
    if (cmd == "flatten")  return cmd_flatten(argc - 1, argv + 1);
    if (cmd == "backfill") return cmd_backfill(argc - 1, argv + 1);
    if (cmd == "query")    return cmd_query(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
