#ifndef DSPFAST_H
#define DSPFAST_H

/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <QString>
#include <QStringList>
#include <QList>

namespace Dspf
{
    struct Indicator
    {
        quint8 number; // 1..99
        bool negated;
        Indicator(quint8 n = 0, bool neg = false):number(n),negated(neg) {}
        bool isValid() const { return number >= 1 && number <= 99; }
        bool operator==( const Indicator& rhs ) const { return number == rhs.number && negated == rhs.negated; }
        bool operator!=( const Indicator& rhs ) const { return !( *this == rhs ); }
    };
    typedef QList<Indicator> Indicators;

    struct Attribute
    {
        QString text; // keyword text, continuation lines merged
        Indicators indicators;
        int lineIndex;
        int lastLineIndex;
        Attribute():lineIndex(-1),lastLineIndex(-1) {}
        Attribute(const QString& t, const Indicators& i, int first, int last):
            text(t),indicators(i),lineIndex(first),lastLineIndex(last) {}
        bool operator==( const Attribute& rhs ) const;
    };
    typedef QList<Attribute> Attributes;

    struct Size
    {
        enum Source { Default, Window };
        quint16 rows;
        quint16 cols;
        QString label;
        quint16 originRow; // 0 unless source is Window
        quint16 originCol;
        quint8 source;
        Size():rows(0),cols(0),originRow(0),originCol(0),source(Default) {}
        Size(quint16 r, quint16 c, const QString& l):rows(r),cols(c),label(l),originRow(0),originCol(0),source(Default) {}
        bool isValid() const { return rows > 0 && cols > 0; }
        bool operator==( const Size& rhs ) const;
        bool operator!=( const Size& rhs ) const { return !( *this == rhs ); }
    };

    class Element
    {
    public:
        enum Kind { Invalid, FileDecl, RecordDecl, FieldDecl, ConstDecl, AttrLine };
        quint8 kind;

        int lineIndex; // 0-based source line
        int lastLineIndex; // last physical line belonging to the element incl. its keyword lines

        QString name; // record or field name; ConstDecl: literal text including quotes
        QString record; // FieldDecl, ConstDecl: owning record, empty if none precedes
        Attributes attributes; // AttrLine: the keyword text of the line(s) itself
        Indicators indicators;

        // FieldDecl:
        QChar type;
        QChar usage;
        quint16 length; // 0 if absent
        qint8 decimals; // -1 if absent
        quint16 row; // 0 if absent or hidden
        quint16 col;
        uint hidden : 1;
        uint referenced : 1;

        // RecordDecl:
        int endLineIndex;
        Size size;

        Element(Kind k = Invalid, int line = -1):kind(k),lineIndex(line),lastLineIndex(line),
            length(0),decimals(-1),row(0),col(0),hidden(0),referenced(0),endLineIndex(-1) {}

        bool isOwner() const { return kind >= FileDecl && kind <= ConstDecl; }
        bool hasPos() const { return row > 0 && col > 0; }
        QStringList attributeTexts() const;
        const char* typeName() const;
        bool operator==( const Element& rhs ) const;
        bool operator!=( const Element& rhs ) const { return !( *this == rhs ); }
    };
    typedef QList<Element> ElementList;

    struct FieldInfo
    {
        QString name;
        QChar type;
        quint16 row;
        quint16 col;
        quint16 length;
        QStringList attributes;
        Indicators indicators;
        int lineIndex;
        int lastLineIndex;
        FieldInfo():row(0),col(0),length(0),lineIndex(-1),lastLineIndex(-1) {}
        bool operator==( const FieldInfo& rhs ) const;
    };

    struct ConstantInfo
    {
        QString name; // literal without the enclosing quotes
        quint16 row;
        quint16 col;
        quint16 length;
        QStringList attributes;
        Indicators indicators;
        int lineIndex;
        int lastLineIndex;
        ConstantInfo():row(0),col(0),length(0),lineIndex(-1),lastLineIndex(-1) {}
        bool operator==( const ConstantInfo& rhs ) const;
    };

    struct RecordEntry
    {
        QString name;
        QStringList attributes;
        QList<FieldInfo> fields;
        QList<ConstantInfo> constants;
        int startLine;
        int endLine;
        Size size;
        bool subfile;
        RecordEntry():startLine(-1),endLine(-1),subfile(false) {}
        const FieldInfo* findField(const QString& name) const;
        const ConstantInfo* findConstant(const QString& name) const;
        bool operator==( const RecordEntry& rhs ) const;
    };
    typedef QList<RecordEntry> Catalog;

    struct Document
    {
        ElementList elements; // FileDecl at index 0, no AttrLine elements
        Catalog catalog;
        Size defaultSize;
        Size alternateSize; // invalid unless DSPSIZ names a second display
        int lineCount;

        Document():lineCount(0) {}
        const Element& file() const { return elements.first(); }
        const RecordEntry* findRecord(const QString& name) const;
        RecordEntry* findRecord(const QString& name);
        const Element* findRecordDecl(const QString& name) const;
        QList<const Element*> records() const;
        bool isEmpty() const { return elements.isEmpty(); }
        void clear();
        bool operator==( const Document& rhs ) const;
        bool operator!=( const Document& rhs ) const { return !( *this == rhs ); }
    };
}

#endif // DSPFAST_H
