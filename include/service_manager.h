#pragma once

#include <string>
#include "option.h"
#include "command_runner.h"

class ServiceManager {
public:
    virtual ~ServiceManager() = default;

    virtual Option<bool> restart(const std::string& service_name) = 0;
};

class SystemdServiceManager: public ServiceManager {
private:
    CommandRunner& runner;

public:
    explicit SystemdServiceManager(CommandRunner& runner);

    Option<bool> restart(const std::string& service_name) override;
};
