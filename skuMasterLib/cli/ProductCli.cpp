#include <skumaster/cli/ProductCli.hpp>
#include <skumaster/skumaster.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <ostream>

#ifndef SKUMASTER_DEFAULT_DATA_FILE
#define SKUMASTER_DEFAULT_DATA_FILE "product_master_data.csv"
#endif

namespace SkuMaster::cli {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// 출력 폭 계산은 UTF-8 코드 포인트 기준 (₱ 는 3바이트지만 한 칸)
size_t displayWidth(const std::string& s) {
    return static_cast<size_t>(std::count_if(
        s.begin(), s.end(), [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

void writePadded(std::ostream& out, const std::string& s, size_t width, bool rightAlign) {
    const size_t w = displayWidth(s);
    const std::string pad(w < width ? width - w : 0, ' ');
    if (rightAlign)
        out << pad << s;
    else
        out << s << pad;
}

/// @brief Form defaults for fields the operator did not supply
FieldMap inputDefaults() {
    FieldMap raw;
    raw[fieldName(ProductField::Status)] = "Active";
    raw[fieldName(ProductField::ExpiryItem)] = "No";
    raw[fieldName(ProductField::SellingBan)] = "No";
    raw[fieldName(ProductField::TesterProduct)] = "No";
    return raw;
}

bool loadCatalog(CsvFileRepositoryImpl& repo, ProductCatalog& catalog, std::ostream& err) {
    std::error_code ec;
    if (!catalog.load(repo, ec)) {
        err << "Load Error: An error occurred while loading data from " << repo.path() << ": "
            << ec.message() << "\n";
        return false;
    }
    return true;
}

int cmdFields(std::ostream& out) {
    size_t width = 0;
    for (const auto& def : kProductFields)
        width = std::max(width, displayWidth(def.name));

    size_t n = 1;
    for (const auto& def : kProductFields) {
        out << (n < 10 ? " " : "") << n << "  ";
        writePadded(out, def.name, width, false);
        out << "  " << fieldKindName(def.kind) << "\n";
        ++n;
    }
    return kExitOk;
}

int cmdList(CsvFileRepositoryImpl& repo, std::ostream& out, std::ostream& err) {
    ProductCatalog catalog;
    if (!loadCatalog(repo, catalog, err))
        return kExitFailure;

    if (catalog.empty()) {
        out << "No products.\n";
        return kExitOk;
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(catalog.size());
    for (const auto& p : catalog.records())
        rows.push_back(p.toDisplayRow());

    std::vector<size_t> widths(kDisplayColumnCount);
    for (size_t c = 0; c < kDisplayColumnCount; ++c) {
        widths[c] = displayWidth(kDisplayHeadings[c]);
        for (const auto& row : rows)
            widths[c] = std::max(widths[c], displayWidth(row[c]));
    }

    // SRP 열만 오른쪽 정렬
    const size_t srpColumn = 5;
    auto writeRow = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < kDisplayColumnCount; ++c) {
            if (c != 0)
                out << "  ";
            writePadded(out, cells[c], widths[c], c == srpColumn);
        }
        out << "\n";
    };

    writeRow(std::vector<std::string>(kDisplayHeadings.begin(), kDisplayHeadings.end()));
    for (const auto& row : rows)
        writeRow(row);
    out << catalog.size() << " product(s)\n";
    return kExitOk;
}

int cmdSummary(CsvFileRepositoryImpl& repo, std::ostream& out, std::ostream& err) {
    ProductCatalog catalog;
    if (!loadCatalog(repo, catalog, err))
        return kExitFailure;

    const FieldList metrics = toDisplayMetrics(analyzeProducts(catalog.records()));

    out << "Master Data Analysis Summary\n";
    for (const auto& m : metrics) {
        // 대시보드 카드 제목은 "Avg SRP" 대신 "Average SRP"로 표시한다.
        const std::string label = (m.first == "Avg SRP") ? "Average SRP" : m.first;
        out << "  ";
        writePadded(out, label, 16, false);
        out << " : " << m.second << "\n";
    }
    return kExitOk;
}

int cmdAdd(CsvFileRepositoryImpl& repo, const std::vector<std::string>& assignments,
           std::ostream& out, std::ostream& err) {
    if (assignments.empty()) {
        err << "add: expected one or more <Field>=<Value> arguments\n";
        return kExitUsage;
    }

    FieldMap raw = inputDefaults();
    for (const auto& a : assignments) {
        const size_t eq = a.find('=');
        if (eq == std::string::npos) {
            err << "add: expected <Field>=<Value>, got '" << a << "'\n";
            return kExitUsage;
        }
        const std::string name = a.substr(0, eq);
        if (!findField(name)) {
            err << "add: unknown field '" << name << "' (see 'skumaster fields')\n";
            return kExitUsage;
        }
        raw[name] = a.substr(eq + 1);
    }

    ProductCatalog catalog;
    if (!loadCatalog(repo, catalog, err))
        return kExitFailure;

    std::error_code ec;
    const std::string& sku = raw[fieldName(ProductField::SkuCode)];
    if (!sku.empty()) {
        if (repo.existsById(sku, ec))
            err << "warning: SKU Code '" << sku << "' already exists\n";
        else if (ec)
            err << "warning: could not check for duplicate SKU Code: " << ec.message() << "\n";
    }

    const ProductRecord* added = catalog.addFromInput(raw, ec);
    if (!added) {
        if (ec == std::errc::invalid_argument)
            err << "Input Error: SKU Code and SKU Name are required fields.\n";
        else
            err << "Error: An unexpected error occurred during creation: " << ec.message()
                << "\n";
        return kExitFailure;
    }
    const std::string name = added->skuName;

    // 저장에 실패하면 추가도 성공으로 보고하지 않는다.
    if (!catalog.save(repo, ec)) {
        err << "Save Error: An error occurred while saving: " << ec.message() << "\n";
        return kExitFailure;
    }
    out << "Product '" << name << "' added successfully.\n";
    out << "Data saved successfully to " << repo.path() << ".\n";
    return kExitOk;
}

int cmdShow(CsvFileRepositoryImpl& repo, const std::string& sku, std::ostream& out,
            std::ostream& err) {
    std::error_code ec;
    auto found = repo.findById(sku, ec);
    if (ec) {
        err << "Load Error: An error occurred while loading data from " << repo.path() << ": "
            << ec.message() << "\n";
        return kExitFailure;
    }
    if (!found) {
        err << "Product not found: " << sku << "\n";
        return kExitFailure;
    }

    size_t width = 0;
    for (const auto& def : kProductFields)
        width = std::max(width, displayWidth(def.name));
    for (const auto& kv : found->toStorageMap()) {
        writePadded(out, kv.first, width, false);
        out << " : " << kv.second << "\n";
    }
    return kExitOk;
}

} // namespace

std::string resolveDataFile(const std::string& cliValue) {
    if (!cliValue.empty())
        return cliValue;
    const char* env = std::getenv(kDataFileEnv);
    if (env && *env)
        return env;
    return SKUMASTER_DEFAULT_DATA_FILE;
}

bool parseOptions(const std::vector<std::string>& args, Options& opts, std::string& error) {
    opts = Options{};
    std::string fileArg;

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--help" || a == "-h") {
            opts.help = true;
        } else if (a == "--file" || a == "-f") {
            if (i + 1 >= args.size()) {
                error = a + " requires a path";
                return false;
            }
            fileArg = args[++i];
        } else if (a.rfind("--file=", 0) == 0) {
            fileArg = a.substr(7);
        } else if (!a.empty() && a[0] == '-') {
            error = "unknown option: " + a;
            return false;
        } else {
            break;
        }
    }

    opts.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    opts.dataFile = resolveDataFile(fileArg);
    return true;
}

void printUsage(std::ostream& out) {
    out << "SkuMaster " << VERSION_STRING << " - product master data manager\n"
           "\n"
           "Usage:\n"
           "  skumaster [--file <path>] <command> [args...]\n"
           "\n"
           "Commands:\n"
           "  list                     Show all products\n"
           "  summary                  Show the analytical dashboard\n"
           "  add <Field>=<Value>...   Add a product and save the data file\n"
           "  show <SKU Code>          Show every field of one product\n"
           "  fields                   List the recognized field names\n"
           "\n"
           "Options:\n"
           "  -f, --file <path>        Data file (default: $"
        << kDataFileEnv << " or " << SKUMASTER_DEFAULT_DATA_FILE
        << ")\n"
           "  -h, --help               Show this help\n";
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    Options opts;
    std::string error;
    if (!parseOptions(args, opts, error)) {
        err << error << "\n\n";
        printUsage(err);
        return kExitUsage;
    }

    if (opts.help || opts.command.empty()) {
        printUsage(out);
        return opts.help ? kExitOk : kExitUsage;
    }

    const std::string& cmd = opts.command[0];
    const std::vector<std::string> rest(opts.command.begin() + 1, opts.command.end());

    if (cmd == "fields")
        return cmdFields(out);

    CsvFileRepositoryImpl repo(opts.dataFile);

    if (cmd == "list")
        return cmdList(repo, out, err);
    if (cmd == "summary")
        return cmdSummary(repo, out, err);
    if (cmd == "add")
        return cmdAdd(repo, rest, out, err);
    if (cmd == "show") {
        if (rest.size() != 1) {
            err << "show: expected exactly one <SKU Code>\n";
            return kExitUsage;
        }
        return cmdShow(repo, rest[0], out, err);
    }

    err << "Unknown command: " << cmd << "\n\n";
    printUsage(err);
    return kExitUsage;
}

} // namespace SkuMaster::cli
