#pragma once

#include <string>
#include <iostream>
#include <glog/logging.h>
