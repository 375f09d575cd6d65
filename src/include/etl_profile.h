/**
 * @copyright Copyright The FiniteResource Contributors
 * @brief ETL configuration for FiniteResource.
 */

#ifndef FINITERESOURCE_SRC_INCLUDE_ETL_PROFILE_H_
#define FINITERESOURCE_SRC_INCLUDE_ETL_PROFILE_H_

// Use generic C++23 profile as base
#define ETL_CPP23_SUPPORTED 1

#define ETL_NO_CHECKS 0

// 容量检查由调用方完成，错误通过 Expected 返回
#define ETL_NO_EXCEPTIONS 1

#endif  // FINITERESOURCE_SRC_INCLUDE_ETL_PROFILE_H_
