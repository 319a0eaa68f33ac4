#include "host_io.hpp"
#include "log.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string LocalFileHost::read_text(const std::string& p){
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + p);
    std::ostringstream ss; ss << f.rdbuf();
    if (f.bad()) throw std::runtime_error("read failed: " + p);
    return ss.str();
}

void LocalFileHost::write_text(const std::string& p, const std::string& s){
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open for writing: " + p);
    f << s;
    f.flush();
    if (!f) throw std::runtime_error("write failed: " + p);
}

std::string backup_path_for(const std::string& path, std::time_t when){
    std::tm tm{};
    localtime_r(&when, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
    return path + ".backup_" + stamp;
}

std::string LocalFileHost::copy_file(const std::string& path){
    std::string dest = backup_path_for(path, std::time(nullptr));
    write_text(dest, read_text(path));
    log_info("backup written to %s", dest.c_str());
    return dest;
}
