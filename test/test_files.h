#ifndef LINELOOKUP_TEST_FILES_H
#define LINELOOKUP_TEST_FILES_H

#include <fstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

// A scratch directory, removed with everything in it on destruction.
class scratch_dir {
public:
    scratch_dir() {
        namespace fs = boost::filesystem;
        path_ = fs::temp_directory_path() / fs::unique_path("linelookup-%%%%-%%%%-%%%%");
        fs::create_directories(path_);
    }
    ~scratch_dir() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    std::string path(const std::string &name) const {
        return (path_ / name).string();
    }

    // Writes `contents' verbatim and returns the file's path.
    std::string write(const std::string &name, const std::string &contents) const {
        std::string p = path(name);
        std::ofstream out(p.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
        out.write(contents.data(), contents.size());
        return p;
    }

    std::string root() const {
        return path_.string();
    }
private:
    boost::filesystem::path path_;
};

// key0 .. key{n-1}, then "needle", every line newline-terminated.
inline std::string make_haystack(int n) {
    std::string out;
    for (int i = 0; i < n; ++i)
        out += "key" + std::to_string(i) + "\n";
    out += "needle\n";
    return out;
}

#endif
