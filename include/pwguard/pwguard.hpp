#pragma once

// Public entry point for applications embedding the password validator

#include "validation/passworderror.hpp"
#include "validation/validationresult.hpp"
#include "validation/passwordrule.hpp"
#include "validation/rules.hpp"
#include "validation/passwordvalidator.hpp"
#include "config/validatorconfig.hpp"
