#ifndef ROWBIND_SCANNABLE_H
#define ROWBIND_SCANNABLE_H

#include <vector>

#include "rowbind/scan_target.h"

namespace rowbind {

    // 可以保存单行结果的对象.
    // scanTargets() 按查询的列顺序返回字段槽位, 例如:
    //
    //   struct Label : rowbind::ISingleScannable {
    //       int32_t id = 0;
    //       std::string name;
    //       std::vector<rowbind::ScanTarget> scanTargets() override {
    //           return {&id, &name};
    //       }
    //   };
    class ISingleScannable {
      public:
        virtual ~ISingleScannable() = default;

        virtual std::vector<ScanTarget> scanTargets() = 0;
    };

    // 可以保存任意多行结果的对象.
    // newElement() 对每一行调用一次: 通常向底层容器追加一个新元素并返回它.
    // 返回的引用只在该行的 scan 完成之前使用.
    class IMultiScannable {
      public:
        virtual ~IMultiScannable() = default;

        virtual ISingleScannable& newElement() = 0;
    };

}  // namespace rowbind

#endif  // ROWBIND_SCANNABLE_H
