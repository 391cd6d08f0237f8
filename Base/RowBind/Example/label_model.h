#pragma once

#include <QDateTime>
#include <QDebug>
#include <QString>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rowbind/scannable.h"

// 对应查询: SELECT id, name, color, priority, created_at FROM labels
class Label : public rowbind::ISingleScannable {
  public:
    int64_t id = 0;
    QString name;
    std::optional<std::string> color;  // 可为 NULL
    int32_t priority = 0;
    QDateTime created_at;

    std::vector<rowbind::ScanTarget> scanTargets() override {
        return {&id, &name, &color, &priority, &created_at};
    }

    void print() const {
        qDebug().nospace() << "Label - ID: " << id << ", Name: " << name << ", Color: " << (color ? QString::fromStdString(*color) : QStringLiteral("<null>")) << ", Priority: " << priority << ", Created At: " << created_at.toString(Qt::ISODateWithMs);
    }
};
