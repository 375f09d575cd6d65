/**
 * @file config.h
 * @brief 配置文件
 * @copyright Copyright The FiniteResource Contributors
 */

#ifndef FINITERESOURCE_SRC_INCLUDE_CONFIG_H_
#define FINITERESOURCE_SRC_INCLUDE_CONFIG_H_

#include "project_config.h"

#endif /* FINITERESOURCE_SRC_INCLUDE_CONFIG_H_ */
