#include "test_env.hpp"
#include <cstdlib>

void set_env(const char* name, const char* value){
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if(!value || !*value) ::unsetenv(name);
    else ::setenv(name, value, 1);
#endif
}

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name) {
    if(const char* old = std::getenv(name)) previous_ = std::string(old);
    set_env(name, value);
}

ScopedEnv::~ScopedEnv(){
    set_env(name_.c_str(), previous_ ? previous_->c_str() : nullptr);
}
