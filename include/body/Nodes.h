#pragma once

#include "body/Block.h"
#include "body/Node.h"
#include "body/NodeKind.h"
#include "body/BinaryExpr.h"
#include "body/CallExpr.h"
#include "body/CastExpr.h"
#include "body/FieldAccessExpr.h"
#include "body/LiteralExpr.h"
#include "body/NameExpr.h"
#include "body/NewExpr.h"
#include "body/SuperExpr.h"
#include "body/ThisExpr.h"
#include "body/CommentStmt.h"
#include "body/ExprStmt.h"
#include "body/IfStmt.h"
#include "body/LocalVarStmt.h"
#include "body/ReturnStmt.h"
#include "body/ThrowStmt.h"
