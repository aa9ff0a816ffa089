#pragma once

#include <QString>

namespace planner {
namespace data {

struct ResourcePoolItem
{
    QString id;
    QString name;
    int totalQuantity = 0; // tasks the resource can carry on a single day
};

} // namespace data
} // namespace planner
